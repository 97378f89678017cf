/**
 * @file TransferOutcome.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <string>

namespace msync
{
enum class TransferClassification : std::uint8_t
{
    FULL_SUCCESS,
    PARTIAL_SUCCESS,
    FAILURE,
};

struct TransferOutcome
{
    // Exit code exactly as reported by rsync
    int                    exitCode = 0;
    TransferClassification classification
        = TransferClassification::FULL_SUCCESS;
    // Only populated for failures
    std::string            output;

    [[nodiscard]]
    auto succeeded() const -> bool
    {
        return classification != TransferClassification::FAILURE;
    }

    // Partial transfers are reported to the caller as a success
    [[nodiscard]]
    auto process_exit_code() const -> int
    {
        return (succeeded() ? 0 : exitCode);
    }
};
} // namespace msync
