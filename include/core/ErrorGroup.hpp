// Core data model for per-run signature groups.
// Produced by the grouper, annotated by the classifier, consumed by the
// history store and the reporters.

#ifndef ERRORWATCH_CORE_ERROR_GROUP_HPP
#define ERRORWATCH_CORE_ERROR_GROUP_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace ErrorWatch
{
namespace core
{

/// Normalized grouping key derived from a log message.
using Signature = std::string;

/**
 * @brief Aggregate of all records that share one signature in a single run.
 *
 * Invariants:
 *  - count equals the number of records mapped to this signature.
 *  - sampleMessage is the first record seen for the signature and is
 *    never overwritten afterwards.
 *  - lastSeenTimestamp is the greatest record timestamp (string order).
 */
struct SignatureAggregate
{
    Signature             signature;
    std::uint64_t         count{0};
    std::set<std::string> sources;             ///< Distinct record sources, sorted.
    std::string           firstSeenTimestamp;  ///< Smallest record timestamp.
    std::string           lastSeenTimestamp;   ///< Greatest record timestamp.
    std::string           sampleMessage;       ///< First contributing message.
};

/// Signature -> aggregate, ordered by signature for stable iteration.
using AggregateMap = std::map<Signature, SignatureAggregate>;

/**
 * @brief A signature aggregate after noise classification.
 */
struct ClassifiedGroup
{
    SignatureAggregate aggregate;
    bool               isNoise{false};

    const Signature& signature() const noexcept { return aggregate.signature; }
    std::uint64_t count() const noexcept { return aggregate.count; }
};

/**
 * @brief Report ordering: count descending, then signature ascending.
 */
inline bool reportOrder(const ClassifiedGroup& a, const ClassifiedGroup& b) noexcept
{
    if (a.count() != b.count())
        return a.count() > b.count();
    return a.signature() < b.signature();
}

} // namespace core
} // namespace ErrorWatch

#endif // ERRORWATCH_CORE_ERROR_GROUP_HPP
