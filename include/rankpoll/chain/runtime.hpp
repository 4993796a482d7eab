#ifndef RANKPOLL_CHAIN_RUNTIME_HPP
#define RANKPOLL_CHAIN_RUNTIME_HPP

#include <rankpoll/poll/types.hpp>
#include <rankpoll/poll/operation.hpp>
#include <string>
#include <cstdint>

namespace rankpoll {

// Token amount granted to a chain when it is opened
typedef uint64_t Amount;

// Registration data of a chain known to the host
struct ChainRecord {
    ChainId id;
    ChainId parent;          // Empty for the root chain
    std::string owner;       // Sole owner
    Amount balance;
    int64_t created_at;      // Unix timestamp
    
    ChainRecord() : balance(0), created_at(0) {}
};

// What a contract may ask of the substrate while executing one call.
// Effects requested here only take place if the call succeeds.
class ContractRuntime {
public:
    virtual ~ContractRuntime() {}
    
    // Chain the current call executes on
    virtual const ChainId& chain_id() const = 0;
    
    // Authenticated signer of the current operation; empty when the call is
    // unsigned (and always empty while handling a message)
    virtual const std::string& authenticated_signer() const = 0;
    
    // Open a new chain owned solely by owner and funded with balance
    virtual ChainId open_chain(const std::string& owner, Amount balance) = 0;
    
    // Queue a one-way message to target; delivery is never acknowledged
    virtual void send_message(const ChainId& target, const Message& message) = 0;
};

} // namespace rankpoll

#endif // RANKPOLL_CHAIN_RUNTIME_HPP
