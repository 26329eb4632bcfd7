//! # CLI Utilities Interface
//!
//! | Function          | Description               |
//! |-------------------|---------------------------|
//! | `print_usage()`   | Print top-level help text |
//! | `print_version()` | Print tool version        |

#pragma once

namespace doclink::cli {

// Help text
void print_usage();
void print_version();

} // namespace doclink::cli
