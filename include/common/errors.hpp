#pragma once

#include <stdexcept>
#include <string>

namespace rd {

/**
 * @brief Source file extension is not one the pipeline converts
 */
class UnsupportedFormatError : public std::runtime_error {
public:
    explicit UnsupportedFormatError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Source document could not be read (missing, corrupt, encrypted, malformed)
 */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief A resource was registered twice with the same original path
 */
class DuplicateResourceError : public std::logic_error {
public:
    explicit DuplicateResourceError(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief An operation referred to a resource the mapper does not know
 */
class UnknownResourceError : public std::logic_error {
public:
    explicit UnknownResourceError(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief A chapter cannot be rewritten into the DTD-legal subset
 */
class ComplianceError : public std::runtime_error {
public:
    ComplianceError(const std::string& chapter_id, const std::string& what)
        : std::runtime_error(what), chapter_id_(chapter_id) {}

    const std::string& chapter_id() const { return chapter_id_; }

private:
    std::string chapter_id_;
};

/**
 * @brief DTD validation cannot run (support compiled out, DTD not loadable)
 */
class ValidatorUnavailableError : public std::runtime_error {
public:
    explicit ValidatorUnavailableError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief The output tree or archive could not be written
 */
class PackagingError : public std::runtime_error {
public:
    explicit PackagingError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace rd
