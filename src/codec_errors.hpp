#ifndef CODEC_ERRORS_HPP
#define CODEC_ERRORS_HPP

/**
 * @file codec_errors.hpp
 * @brief Exception types raised by the entropy coders.
 *
 * Every failure that depends on the data being coded (as opposed to API
 * misuse, which raises std::invalid_argument) is reported as a CodecError.
 * The concrete subclass and kind() identify what went wrong:
 *
 * - EmptyAlphabet:     no symbol has a positive frequency.
 * - UnknownSymbol:     a symbol has no entry in the active table or model.
 * - CorruptStream:     malformed or truncated encoded input.
 * - OutOfData:         the bit reader was asked for bits past the buffer end.
 * - PrecisionOverflow: frequency totals do not fit the coder's precision.
 *
 * CodecError derives from std::runtime_error, so code catching the standard
 * hierarchy keeps working.
 */

#include <stdexcept>
#include <string>

enum class ErrorKind {
    EMPTY_ALPHABET,
    UNKNOWN_SYMBOL,
    CORRUPT_STREAM,
    OUT_OF_DATA,
    PRECISION_OVERFLOW
};

class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& what_arg)
        : std::runtime_error(what_arg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class EmptyAlphabetError : public CodecError {
public:
    explicit EmptyAlphabetError(const std::string& what_arg)
        : CodecError(ErrorKind::EMPTY_ALPHABET, what_arg) {}
};

class UnknownSymbolError : public CodecError {
public:
    explicit UnknownSymbolError(const std::string& what_arg)
        : CodecError(ErrorKind::UNKNOWN_SYMBOL, what_arg) {}
};

class CorruptStreamError : public CodecError {
public:
    explicit CorruptStreamError(const std::string& what_arg)
        : CodecError(ErrorKind::CORRUPT_STREAM, what_arg) {}
};

class OutOfDataError : public CodecError {
public:
    explicit OutOfDataError(const std::string& what_arg)
        : CodecError(ErrorKind::OUT_OF_DATA, what_arg) {}
};

class PrecisionOverflowError : public CodecError {
public:
    explicit PrecisionOverflowError(const std::string& what_arg)
        : CodecError(ErrorKind::PRECISION_OVERFLOW, what_arg) {}
};

#endif // CODEC_ERRORS_HPP
