//! # Run Report Rendering
//!
//! Prints a MigrationReport to stdout as text or JSON.
//!
//! ## Text Layout
//!
//! ```text
//! Proposed edits:
//!   index.md:3:14  kyverno-image-security.md -> kyverno-image/security.md
//! Issues:
//!   opa-rbac/roles.md:9:7  error  [D002] 'gone.md' points at 'gone.md', ...
//! Summary:
//!   files scanned    42
//!   ...
//! ```

#pragma once

#include "common.hpp"
#include "migrate/pipeline.hpp"

#include <ostream>

namespace doclink::cli {

void print_report(const migrate::MigrationReport& report, OutputFormat format, std::ostream& out);

} // namespace doclink::cli
