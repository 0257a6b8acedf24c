/**
 * Runbox Identifiers
 */
#pragma once
#include <string>

namespace runbox::util {

// Random version-4 style UUID string
std::string generate_execution_id();

} // namespace runbox::util
