#pragma once

#include <string>

/// Lowercase hex SHA-256 of `data`.
std::string Sha256Hex(const std::string& data);
