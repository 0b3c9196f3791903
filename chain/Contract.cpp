#include "Contract.h"
#include "Chain.h"

namespace pl {

Contract::Contract(Chain &chain, const Address &address,
                   const std::string &loggerName)
    : Module(loggerName), chain_(chain), address_(address) {}

int64_t Contract::getHeldValue() const { return chain_.getBalance(address_); }

void Contract::emit(const std::string &name, nlohmann::json args) {
  chain_.emit(address_, name, std::move(args));
}

} // namespace pl
