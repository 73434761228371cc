#pragma once

#include <exception>
#include <ostream>

// Prints why a run failed, naming the stage for CropErrors, and returns the
// process exit code (1).
int report_failure(const std::exception& error, std::ostream& err);
