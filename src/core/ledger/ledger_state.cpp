#include <ledgerstream/core/ledger/ledger_state.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace LedgerStream {

const char* const STATE_MACHINE_DOC = R"(State Machine:

    [PENDING] -> [FETCHING] -> [FETCHED] -> [PARSING] -> [PARSED] -> [VALIDATING] -> [VALIDATED]
    [VALIDATED] -> [IR_BUILDING] -> [IR_READY] -> [EMBEDDING] -> [INDEXED] -> [COMPLETED]
    [IR_READY] -> [COMPLETED]    [EMBEDDING] -> [COMPLETED]

    Every state after PENDING except COMPLETED may move to [FAILED].
    Retry loop: [FETCHING] -> [RETRYING], [FAILED] -> [RETRYING] -> [FETCHING])";

namespace {

using StateSet = std::set<LedgerState>;

const std::array<StateSet, LEDGER_STATE_COUNT>& transitionTable() {
    using S = LedgerState;
    static const std::array<StateSet, LEDGER_STATE_COUNT> table = {{
        /* PENDING     */ {S::FETCHING},
        /* FETCHING    */ {S::FETCHED, S::FAILED, S::RETRYING},
        /* FETCHED     */ {S::PARSING, S::FAILED},
        /* PARSING     */ {S::PARSED, S::FAILED},
        /* PARSED      */ {S::VALIDATING, S::FAILED},
        /* VALIDATING  */ {S::VALIDATED, S::FAILED},
        /* VALIDATED   */ {S::IR_BUILDING, S::FAILED},
        /* IR_BUILDING */ {S::IR_READY, S::FAILED},
        /* IR_READY    */ {S::EMBEDDING, S::COMPLETED, S::FAILED},
        /* EMBEDDING   */ {S::INDEXED, S::COMPLETED, S::FAILED},
        /* INDEXED     */ {S::COMPLETED, S::FAILED},
        /* RETRYING    */ {S::FETCHING, S::FAILED},
        /* COMPLETED   */ {},
        /* FAILED      */ {S::RETRYING, S::FAILED},
    }};
    return table;
}

// Historical labels written by earlier ledger formats; keys are lower case
const std::unordered_map<std::string, LedgerState>& aliasTable() {
    static const std::unordered_map<std::string, LedgerState> aliases = {
        {"auto_done", LedgerState::COMPLETED},
        {"auto_failed", LedgerState::FAILED},
        {"auto_inflight", LedgerState::FETCHING},
        {"mineru_failed", LedgerState::FAILED},
        {"mineru_inflight", LedgerState::IR_BUILDING},
        {"pdf_downloaded", LedgerState::FETCHED},
        {"pdf_ir_ready", LedgerState::IR_READY},
        {"ir_exists", LedgerState::IR_READY},
        {"ir_written", LedgerState::IR_READY},
        {"postpdf_started", LedgerState::EMBEDDING},
    };
    return aliases;
}

// Canonical names keyed by upper-case spelling
const std::unordered_map<std::string, LedgerState>& canonicalTable() {
    static const std::unordered_map<std::string, LedgerState> names = [] {
        std::unordered_map<std::string, LedgerState> m;
        for (LedgerState s : allLedgerStates()) {
            m.emplace(toString(s), s);
        }
        return m;
    }();
    return names;
}

std::string trimmed(std::string_view token) {
    size_t begin = 0;
    size_t end = token.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(token[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(token[end - 1]))) --end;
    return std::string(token.substr(begin, end - begin));
}

} // namespace

const std::vector<LedgerState>& allLedgerStates() {
    static const std::vector<LedgerState> states = [] {
        std::vector<LedgerState> v;
        v.reserve(LEDGER_STATE_COUNT);
        for (size_t i = 0; i < LEDGER_STATE_COUNT; ++i) {
            v.push_back(static_cast<LedgerState>(i));
        }
        return v;
    }();
    return states;
}

bool isDeclaredState(LedgerState state) {
    return static_cast<size_t>(state) < LEDGER_STATE_COUNT;
}

const char* toString(LedgerState state) {
    switch (state) {
        case LedgerState::PENDING:      return "PENDING";
        case LedgerState::FETCHING:     return "FETCHING";
        case LedgerState::FETCHED:      return "FETCHED";
        case LedgerState::PARSING:      return "PARSING";
        case LedgerState::PARSED:       return "PARSED";
        case LedgerState::VALIDATING:   return "VALIDATING";
        case LedgerState::VALIDATED:    return "VALIDATED";
        case LedgerState::IR_BUILDING:  return "IR_BUILDING";
        case LedgerState::IR_READY:     return "IR_READY";
        case LedgerState::EMBEDDING:    return "EMBEDDING";
        case LedgerState::INDEXED:      return "INDEXED";
        case LedgerState::RETRYING:     return "RETRYING";
        case LedgerState::COMPLETED:    return "COMPLETED";
        case LedgerState::FAILED:       return "FAILED";
        default:                        return "UNKNOWN";
    }
}

LedgerState parseLedgerState(std::string_view token,
                             std::string_view context,
                             std::optional<LedgerState> legacy_fallback) {
    std::string value = trimmed(token);
    if (value.empty()) {
        throw LedgerCorruption(std::string(context) + " is missing a ledger state");
    }

    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto alias = aliasTable().find(lower);
    if (alias != aliasTable().end()) {
        return alias->second;
    }

    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto canonical = canonicalTable().find(upper);
    if (canonical != canonicalTable().end()) {
        return canonical->second;
    }

    if (lower == "legacy") {
        if (legacy_fallback) {
            return *legacy_fallback;
        }
        throw LedgerCorruption(std::string(context) +
                               " references removed legacy state without fallback");
    }

    throw LedgerCorruption(std::string(context) + " contains unknown ledger state: '" + value + "'");
}

std::set<LedgerState> getValidNextStates(LedgerState current) {
    if (!isDeclaredState(current)) {
        return {};
    }
    return transitionTable()[static_cast<size_t>(current)];
}

void validateTransition(LedgerState current, LedgerState next) {
    if (isDeclaredState(current)) {
        const auto& allowed = transitionTable()[static_cast<size_t>(current)];
        if (allowed.count(next) > 0) {
            return;
        }
    }
    throw InvalidStateTransition(std::string("Invalid ledger state transition: ") +
                                 toString(current) + " -> " + toString(next));
}

bool isTerminalState(LedgerState state) {
    return state == LedgerState::COMPLETED;
}

bool isRetryableState(LedgerState state) {
    return state == LedgerState::FAILED;
}

} // namespace LedgerStream
