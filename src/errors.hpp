#ifndef COHORTCEA_ERRORS_HPP
#define COHORTCEA_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cohortcea {

// Malformed or out-of-domain configuration. Always raised before any
// simulation work starts.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Distribution parameters outside their domain (e.g. Beta alpha <= 0)
class DistributionError : public ValidationError {
public:
    explicit DistributionError(const std::string& msg) : ValidationError(msg) {}
};

// Adoption shares for a projection year sum above 1
class AdoptionOverflowError : public ValidationError {
public:
    AdoptionOverflowError(int year, double total_share, const std::string& msg)
        : ValidationError(msg), year_(year), total_share_(total_share) {}

    int year() const { return year_; }
    double total_share() const { return total_share_; }

private:
    int year_;
    double total_share_;
};

// A constructed transition matrix is not row-stochastic
class InvalidTransitionError : public std::runtime_error {
public:
    InvalidTransitionError(const std::string& strategy, int cycle, size_t row,
                           const std::string& msg)
        : std::runtime_error(msg), strategy_(strategy), cycle_(cycle), row_(row) {}

    const std::string& strategy() const { return strategy_; }
    int cycle() const { return cycle_; }
    size_t row() const { return row_; }

private:
    std::string strategy_;
    int cycle_;
    size_t row_;
};

// A PSA iteration could not be evaluated (carries the iteration identity)
class IterationFailedError : public std::runtime_error {
public:
    IterationFailedError(size_t iteration, uint64_t seed, const std::string& msg)
        : std::runtime_error(msg), iteration_(iteration), seed_(seed) {}

    size_t iteration() const { return iteration_; }
    uint64_t seed() const { return seed_; }

private:
    size_t iteration_;
    uint64_t seed_;
};

// Checkpoint resume found draws that would be double-counted or that
// belong to a different run
class ResumeConflictError : public std::runtime_error {
public:
    ResumeConflictError(uint64_t seed, const std::string& msg)
        : std::runtime_error(msg), seed_(seed) {}

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
};

} // namespace cohortcea

#endif // COHORTCEA_ERRORS_HPP
