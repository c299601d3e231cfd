// Core data model for the outcome of one engine run.
// Consumed by the reporters (console, JSON) and by any external notifier.

#ifndef ERRORWATCH_CORE_REPORT_HPP
#define ERRORWATCH_CORE_REPORT_HPP

#include <cstdint>
#include <set>
#include <utility>
#include <string>
#include <vector>

#include "core/ErrorGroup.hpp"

namespace ErrorWatch
{
namespace core
{

/**
 * @brief Result of one batch run: attention and noise groups plus the set of
 *        signatures the history store had never seen before.
 *
 * Responsibilities:
 *  - Serve as an immutable-like snapshot of a completed run.
 *  - Stay independent of any output format.
 *
 * Design notes:
 *  - attention() and noise() are already in report order
 *    (count descending, signature ascending).
 *  - newSignatures() may name signatures from either list.
 */
class RunReport
{
public:
    RunReport() = default;

    // ---------- Groups ----------

    const std::vector<ClassifiedGroup>& attention() const noexcept { return m_attention; }
    const std::vector<ClassifiedGroup>& noise() const noexcept { return m_noise; }

    void setAttention(std::vector<ClassifiedGroup> groups) { m_attention = std::move(groups); }
    void setNoise(std::vector<ClassifiedGroup> groups) { m_noise = std::move(groups); }

    std::size_t patternCount() const noexcept
    {
        return m_attention.size() + m_noise.size();
    }

    /// Sum of record counts over the noise groups.
    std::uint64_t noiseRecordCount() const noexcept
    {
        std::uint64_t total = 0;
        for (const auto& g : m_noise)
            total += g.count();
        return total;
    }

    // ---------- New signatures ----------

    const std::set<Signature>& newSignatures() const noexcept { return m_newSignatures; }
    void setNewSignatures(std::set<Signature> sigs) { m_newSignatures = std::move(sigs); }

    bool isNew(const Signature& sig) const
    {
        return m_newSignatures.find(sig) != m_newSignatures.end();
    }

    // ---------- Counters ----------

    /// Records handed to the run.
    std::uint64_t totalRecords() const noexcept { return m_totalRecords; }
    /// Records that produced a signature.
    std::uint64_t groupedRecords() const noexcept { return m_groupedRecords; }
    /// Records skipped (stack-trace continuation, empty message).
    std::uint64_t skippedRecords() const noexcept { return m_totalRecords - m_groupedRecords; }
    /// History entries evicted by retention during this run.
    std::size_t expiredSignatures() const noexcept { return m_expiredSignatures; }

    void setTotalRecords(std::uint64_t n) noexcept { m_totalRecords = n; }
    void setGroupedRecords(std::uint64_t n) noexcept { m_groupedRecords = n; }
    void setExpiredSignatures(std::size_t n) noexcept { m_expiredSignatures = n; }

    /// Run date ("YYYY-MM-DD") used for history bookkeeping.
    const std::string& runDate() const noexcept { return m_runDate; }
    void setRunDate(std::string date) { m_runDate = std::move(date); }

private:
    std::vector<ClassifiedGroup> m_attention;
    std::vector<ClassifiedGroup> m_noise;
    std::set<Signature>          m_newSignatures;

    std::uint64_t m_totalRecords{0};
    std::uint64_t m_groupedRecords{0};
    std::size_t   m_expiredSignatures{0};
    std::string   m_runDate;
};

} // namespace core
} // namespace ErrorWatch

#endif // ERRORWATCH_CORE_REPORT_HPP
