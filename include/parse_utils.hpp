#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include "logger.hpp"

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, K/KB, M/MB or G/GB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a log level name.
// Format: DEBUG, INFO, WARNING (or WARN), ERROR; case-insensitive.
// Invalid input: sets ok=false and returns LogLevel::INFO.
LogLevel parse_log_level(const std::string& value, bool& ok);

// Interpret a boolean config value.
// Format: empty, 1, true, yes, on are true; 0, false, no, off are false (case-insensitive).
// Invalid input: sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
