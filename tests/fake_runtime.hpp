/*
 * ContractRuntime that records requested effects instead of applying them.
 */
#ifndef RANKPOLL_TESTS_FAKE_RUNTIME_HPP
#define RANKPOLL_TESTS_FAKE_RUNTIME_HPP

#include <rankpoll/chain/runtime.hpp>
#include <string>
#include <vector>
#include <utility>

namespace rankpoll {

class FakeRuntime : public ContractRuntime {
public:
    explicit FakeRuntime(const std::string& signer = "")
        : chain_("1111111111111111111111111111111111111111111111111111111111111111")
        , signer_(signer) {}
    
    const ChainId& chain_id() const override { return chain_; }
    const std::string& authenticated_signer() const override { return signer_; }
    
    ChainId open_chain(const std::string& owner, Amount balance) override {
        ChainRecord record;
        record.id = "child-" + std::to_string(opened.size());
        record.parent = chain_;
        record.owner = owner;
        record.balance = balance;
        opened.push_back(record);
        return record.id;
    }
    
    void send_message(const ChainId& target, const Message& message) override {
        sent.push_back(std::make_pair(target, message));
    }
    
    void set_signer(const std::string& signer) { signer_ = signer; }
    
    std::vector<ChainRecord> opened;
    std::vector<std::pair<ChainId, Message> > sent;

private:
    ChainId chain_;
    std::string signer_;
};

} // namespace rankpoll

#endif // RANKPOLL_TESTS_FAKE_RUNTIME_HPP
