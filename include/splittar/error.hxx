/**
 * @file error.hxx
 * @brief Exception hierarchy thrown by the splittar library.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace splittar {

/**
 * @brief Base class of every error raised by splittar.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Invalid or missing configuration. Raised before any I/O happens.
 */
class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &what) : Error(what) {}
};

/**
 * @brief A size-with-suffix expression could not be turned into a byte count.
 */
class SizeParseError : public ConfigError {
public:
  enum class Reason {
    EmptyInput,    /**< @brief The expression was empty. */
    UnknownSuffix, /**< @brief The trailing multiplier is not in the table. */
    InvalidNumber, /**< @brief The numeric part is not a base-10 int64. */
    SizeOverflow,  /**< @brief number * multiplier does not fit in int64. */
    NotPositive    /**< @brief The resulting size is zero or negative. */
  };

  SizeParseError(Reason reason, const std::string &what)
      : ConfigError(what), reason_(reason) {}

  Reason reason() const noexcept { return reason_; }

private:
  Reason reason_;
};

/**
 * @brief A source or target could not be opened.
 */
class OpenError : public Error {
public:
  explicit OpenError(const std::string &what) : Error(what) {}
};

/**
 * @brief Reading from the source failed for a reason other than end of stream.
 */
class SourceReadError : public Error {
public:
  explicit SourceReadError(const std::string &what) : Error(what) {}
};

/**
 * @brief Writing an entry header or body to the archive failed.
 */
class TargetWriteError : public Error {
public:
  TargetWriteError(std::string entry_name, const std::string &what)
      : Error(what), entry_name_(std::move(entry_name)) {}

  /** @brief Name of the entry being written when the failure happened. */
  const std::string &entry_name() const noexcept { return entry_name_; }

private:
  std::string entry_name_;
};

/**
 * @brief The archive accepted fewer body bytes than were offered.
 */
class ShortWriteError : public TargetWriteError {
public:
  ShortWriteError(std::string entry_name, std::int64_t requested,
                  std::int64_t written);

  std::int64_t requested() const noexcept { return requested_; }
  std::int64_t written() const noexcept { return written_; }

private:
  std::int64_t requested_;
  std::int64_t written_;
};

/**
 * @brief Closing the source or target failed.
 *
 * When the run itself had already failed, primary() holds that failure and
 * what() mentions both.
 */
class CloseError : public Error {
public:
  CloseError(const std::string &what, std::exception_ptr primary = nullptr)
      : Error(what), primary_(std::move(primary)) {}

  const std::exception_ptr &primary() const noexcept { return primary_; }

private:
  std::exception_ptr primary_;
};

/**
 * @brief A tar stream is malformed, or the writer was used out of order.
 */
class ArchiveFormatError : public Error {
public:
  explicit ArchiveFormatError(const std::string &what) : Error(what) {}
};

/**
 * @brief Flatten an exception and its nested causes into one line.
 *
 * Messages are joined with ": " from the outermost to the innermost cause.
 */
std::string describe(const std::exception &e);

} // namespace splittar
