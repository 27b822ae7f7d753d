// Mint a warrior, train it a few times and print what the token URI holds
// Compile: g++ -std=c++23 -I../include chain_battles_demo.cpp -lcrypto -o chain_battles_demo

#include <ChainBattles/chain_battles.hpp>
#include <cstdint>
#include <format>
#include <iostream>
#include <string>

using namespace ChainBattles;

int main() {
    const auto owner = ParseAddress("0x1111111111111111111111111111111111111111");
    const auto stranger = ParseAddress("0x2222222222222222222222222222222222222222");
    if (!owner || !stranger) {
        std::cerr << "bad address literal" << std::endl;
        return 1;
    }

    ChainBattlesRegistry registry;
    auto minted = registry.mint(*owner);
    if (!minted) {
        std::cerr << RegistryResultToString(minted, "minting", registry.total_minted() + 1) << std::endl;
        return 1;
    }
    const TokenId id = minted.value();
    std::cout << std::format("Minted token {} to {}", id, ToHex(*owner)) << std::endl;

    for (std::uint64_t t = 0; t < 3; ++t) {
        auto trained = registry.train(id, *owner, TrainContext{1700000000 + t, *owner});
        if (!trained) {
            std::cerr << RegistryResultToString(trained, "training", id) << std::endl;
            return 1;
        }
        const auto & s = trained.value();
        std::cout << std::format("Trained: level {} health {} strength {} speed {}",
                                 s.level, s.health, s.strength, s.speed) << std::endl;
    }

    auto rejected = registry.train(id, *stranger, TrainContext{1700000100, *stranger});
    std::cout << RegistryResultToString(rejected, "training", id) << std::endl;

    auto uri = registry.token_uri(id);
    if (!uri) {
        std::cerr << RegistryResultToString(uri, "reading", id) << std::endl;
        return 1;
    }
    std::string json;
    if (auto res = JsonDataUri::Decode(uri.value(), json); !res) {
        std::cerr << DataUriResultToString(res) << std::endl;
        return 1;
    }
    std::cout << "Metadata: " << json << std::endl;
    return 0;
}
