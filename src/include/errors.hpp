#pragma once
#include <stdexcept>
#include <string>
#include <QString>

// Invalid configuration; fatal at startup
class ConfigError : public std::runtime_error {
public:
	explicit ConfigError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};

// Local persistence failure (disk full, permission, corrupt file)
class StoreError : public std::runtime_error {
public:
	explicit StoreError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};

// Malformed detection output; the frame is skipped
class VisionInputError : public std::runtime_error {
public:
	explicit VisionInputError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};
