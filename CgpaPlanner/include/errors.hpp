#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/*
-------------------------------------------------------------------------------
 errors.hpp — Exceptions raised by the planner core
-------------------------------------------------------------------------------
Every error derives from CgpaError so the console can report any of them with
a single catch. Errors that reject one element of a batch (a conversion, an
addition, a bucket) carry the zero-based index of that element.

Row-level problems inside a transcript (bad credits, bad dates, missing cells)
are not errors: the normalizer drops those rows and counts them.
-------------------------------------------------------------------------------
*/

struct CgpaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// No row holds both "Course Code" and "Grade".
struct HeaderNotFoundError : CgpaError {
    using CgpaError::CgpaError;
};

// Unrecognized grade symbol, or a grade that cannot be used where it was given.
struct InvalidGradeError : CgpaError {
    using CgpaError::CgpaError;
};

// Zero-credit denominator while planning.
struct DivisionGuardError : CgpaError {
    using CgpaError::CgpaError;
};

// Base for errors that point at one element of a batch.
struct IndexedError : CgpaError {
    IndexedError(std::size_t index, const std::string& what)
        : CgpaError(what), index_(index) {}

    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

struct InvalidConversionError : IndexedError {
    using IndexedError::IndexedError;
};

struct InvalidAdditionError : IndexedError {
    using IndexedError::IndexedError;
};

struct InvalidBucketError : IndexedError {
    using IndexedError::IndexedError;
};

// Bucket count above the planner cap without opt-in.
struct PlanTooLargeError : CgpaError {
    using CgpaError::CgpaError;
};
