#include <ledgerstream/core/adapters/adapter.hpp>
#include <ledgerstream/core/ledger/errors.hpp>

namespace LedgerStream {

std::string errorTypeName(const std::exception& error) {
    if (auto adapter_error = dynamic_cast<const AdapterError*>(&error)) {
        return adapter_error->errorType();
    }
    if (dynamic_cast<const InvalidStateTransition*>(&error)) return "InvalidStateTransition";
    if (dynamic_cast<const LedgerCorruption*>(&error)) return "LedgerCorruption";
    if (dynamic_cast<const LedgerIoError*>(&error)) return "LedgerIoError";
    if (dynamic_cast<const LedgerError*>(&error)) return "LedgerError";
    if (dynamic_cast<const LedgerTypeError*>(&error)) return "LedgerTypeError";
    if (dynamic_cast<const std::invalid_argument*>(&error)) return "invalid_argument";
    if (dynamic_cast<const std::runtime_error*>(&error)) return "runtime_error";
    return "exception";
}

} // namespace LedgerStream
