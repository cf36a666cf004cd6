#pragma once

#ifndef SIMPLERL_ERRORS_HPP
#define SIMPLERL_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace SimpleRL
{
    /**
     * @brief Root of every error raised by the framework.
     *
     * All framework errors derive from std::runtime_error so callers that only
     * care about "something failed" can catch the standard type.
     */
    class SimpleRLError : public std::runtime_error
    {
    public:
        explicit SimpleRLError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief Space or configuration mismatch detected while composing an adapter.
     *
     * Raised eagerly at construction time, before any episode runs. Not retried.
     */
    class TypeIncompatibilityError : public SimpleRLError
    {
    public:
        explicit TypeIncompatibilityError(const std::string &message) : SimpleRLError(message) {}
    };

    /**
     * @brief A continuous element without finite bounds was asked to become discrete.
     */
    class UnboundedConversionError : public TypeIncompatibilityError
    {
    public:
        explicit UnboundedConversionError(const std::string &message) : TypeIncompatibilityError(message) {}
    };

    /**
     * @brief Source and target shapes differ. Values are never reshaped or truncated.
     */
    class ShapeMismatchError : public TypeIncompatibilityError
    {
    public:
        explicit ShapeMismatchError(const std::string &message) : TypeIncompatibilityError(message) {}
    };

    /**
     * @brief Action outside the legal set for the current turn.
     *
     * Recoverable: the environment state is left untouched and the episode goes on.
     */
    class InvalidActionError : public SimpleRLError
    {
    public:
        explicit InvalidActionError(const std::string &message) : SimpleRLError(message) {}
    };

    /**
     * @brief The trainer does not hold enough samples for one optimization step.
     *
     * Recoverable: call train() again once more experience has arrived.
     */
    class InsufficientDataError : public SimpleRLError
    {
    public:
        explicit InsufficientDataError(const std::string &message) : SimpleRLError(message) {}
    };

    /**
     * @brief Blob type tag, version or payload does not match the restoring object.
     *
     * The target keeps its pre-restore state.
     */
    class IncompatibleRestoreError : public SimpleRLError
    {
    public:
        explicit IncompatibleRestoreError(const std::string &message) : SimpleRLError(message) {}
    };
}

#endif //SIMPLERL_ERRORS_HPP
