#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace LedgerStream {

/**
 * Document lifecycle states - the fixed ingestion pipeline phases.
 *
 * Serialized by enum name (upper case). Legacy tokens from older log formats are
 * resolved by parseLedgerState() through a single alias table.
 */
enum class LedgerState : uint8_t {
    PENDING = 0,      // Enqueued, nothing done yet
    FETCHING = 1,     // Retrieving the raw payload upstream
    FETCHED = 2,      // Raw payload staged
    PARSING = 3,
    PARSED = 4,
    VALIDATING = 5,
    VALIDATED = 6,
    IR_BUILDING = 7,  // Building intermediate representation
    IR_READY = 8,
    EMBEDDING = 9,
    INDEXED = 10,
    RETRYING = 11,    // Waiting to re-enter the pipeline after a failure
    COMPLETED = 12,   // Terminal
    FAILED = 13       // Retryable through RETRYING
};

constexpr size_t LEDGER_STATE_COUNT = 14;

extern const char* const STATE_MACHINE_DOC;

/// Every declared state, in enum order
const std::vector<LedgerState>& allLedgerStates();

/// True when the raw value of @p state is one of the declared enumerators
bool isDeclaredState(LedgerState state);

/// Canonical upper-case name ("IR_READY")
const char* toString(LedgerState state);

/**
 * @brief Decode a persisted state token.
 *
 * Accepts canonical names in any case and the legacy alias table
 * ("pdf_ir_ready", "auto_done", ...). The migration placeholder "legacy"
 * resolves to @p legacy_fallback when one is given. Throws LedgerCorruption for
 * anything else.
 * @param context Human-readable location used in the error message
 */
LedgerState parseLedgerState(std::string_view token,
                             std::string_view context = "ledger state",
                             std::optional<LedgerState> legacy_fallback = std::nullopt);

std::set<LedgerState> getValidNextStates(LedgerState current);

/**
 * @brief Throws InvalidStateTransition when @p next is not a declared successor of @p current.
 */
void validateTransition(LedgerState current, LedgerState next);

bool isTerminalState(LedgerState state);
bool isRetryableState(LedgerState state);

} // namespace LedgerStream
