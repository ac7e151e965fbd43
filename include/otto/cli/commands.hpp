#pragma once

namespace otto::cli {

/// Entry point behind `otto`; returns the process exit code.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace otto::cli
