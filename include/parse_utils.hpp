#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <chrono>

// Parse an integer from a string.
// Format: decimal with optional '+' or '-'; trailing characters are rejected.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB, TB, or PB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse milliseconds from a string with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s, or m.
// Bounds: no upper bound beyond integer range; negative values are invalid.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Interpret a config or environment value as a boolean switch.
// "", "1", "true", "yes" and "on" (case-insensitive) are true; anything else is false.
bool parse_bool(const std::string& value);

#endif // PARSE_UTILS_HPP
