/**
 * @file TaxonomyErrors.hpp
 * @brief Exception hierarchy raised by the taxonomy engine.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace typolab::domain::taxonomy {

/**
 * @class TaxonomyError
 * @brief Base class for every deterministic, caller-correctable engine error.
 */
class TaxonomyError : public std::runtime_error {
public:
    explicit TaxonomyError(const std::string& message, std::string classId = "")
        : std::runtime_error(message), m_classId(std::move(classId)) {}

    /** @brief Class the error refers to (may be empty). */
    const std::string& classId() const { return m_classId; }

private:
    std::string m_classId;
};

/** @brief Fewer than two reference objects were supplied to the builder. */
class InsufficientSamples : public TaxonomyError {
public:
    InsufficientSamples(const std::string& className, std::size_t count)
        : TaxonomyError("InsufficientSamples: class '" + className + "' needs at least 2 reference objects, got " +
                        std::to_string(count)),
          m_count(count) {}

    std::size_t count() const { return m_count; }

private:
    std::size_t m_count;
};

/** @brief Registering an id that already exists. */
class DuplicateClassId : public TaxonomyError {
public:
    explicit DuplicateClassId(const std::string& classId)
        : TaxonomyError("DuplicateClassId: class '" + classId + "' is already registered", classId) {}
};

/** @brief Lookup or modification of an id that is not registered. */
class UnknownClassId : public TaxonomyError {
public:
    explicit UnknownClassId(const std::string& classId)
        : TaxonomyError("UnknownClassId: class '" + classId + "' is not registered", classId) {}
};

/** @brief Serialized taxonomy is incomplete, inconsistent or tampered with. */
class MalformedImport : public TaxonomyError {
public:
    explicit MalformedImport(const std::string& detail, const std::string& classId = "",
                             std::string parameter = "")
        : TaxonomyError("MalformedImport: " + Describe(detail, classId, parameter), classId),
          m_parameter(std::move(parameter)) {}

    const std::string& parameter() const { return m_parameter; }

private:
    static std::string Describe(const std::string& detail, const std::string& classId, const std::string& parameter) {
        std::string out = detail;
        if (!classId.empty()) out += " (class '" + classId + "'";
        if (!parameter.empty()) out += (classId.empty() ? " (" : ", ") + std::string("parameter '") + parameter + "'";
        if (!classId.empty() || !parameter.empty()) out += ")";
        return out;
    }

    std::string m_parameter;
};

/** @brief A parameter or class field breaks its invariants. */
class InvalidParameter : public TaxonomyError {
public:
    InvalidParameter(std::string detail, std::string parameter, const std::string& classId = "")
        : TaxonomyError("InvalidParameter: " + detail + " (parameter '" + parameter + "'" +
                        (classId.empty() ? std::string() : ", class '" + classId + "'") + ")", classId),
          m_detail(std::move(detail)),
          m_parameter(std::move(parameter)) {}

    const std::string& detail() const { return m_detail; }
    const std::string& parameter() const { return m_parameter; }

private:
    std::string m_detail;
    std::string m_parameter;
};

/** @brief A modification request is incomplete or targets unknown parameters. */
class InvalidChange : public TaxonomyError {
public:
    InvalidChange(const std::string& detail, const std::string& classId)
        : TaxonomyError("InvalidChange: " + detail + " (class '" + classId + "')", classId) {}
};

} // namespace typolab::domain::taxonomy
