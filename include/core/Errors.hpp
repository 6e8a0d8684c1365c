#pragma once

#include <stdexcept>
#include <string>

namespace MiteSeq {

/**
 * @brief Bad configuration or input data (ORF string, reference, translation table, files).
 *
 * Always fatal: the run is aborted and the message is shown to the user.
 */
class UserError : public std::runtime_error {
public:
    explicit UserError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An internal invariant did not hold (unexpected CIGAR, unlocatable exon, ...).
 */
class InternalError : public std::runtime_error {
public:
    explicit InternalError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace MiteSeq
