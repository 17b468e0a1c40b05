#include "fault_model.hpp"
#include <spdlog/spdlog.h>

namespace blockcopy::core {

auto IdentityFaultModel::transform(std::span<const char> data,
                                   const BlockDescriptor&,
                                   std::uint32_t) -> std::vector<char>
{
    return {data.begin(), data.end()};
}

RandomCorruptionFaultModel::RandomCorruptionFaultModel(double probability, std::uint64_t seed)
    : probability_(probability)
    , seed_(seed)
{}

auto RandomCorruptionFaultModel::transform(std::span<const char> data,
                                           const BlockDescriptor& block,
                                           std::uint32_t attempt) -> std::vector<char>
{
    std::vector<char> out(data.begin(), data.end());
    if (out.empty()) {
        return out;
    }

    // Свой генератор на каждую попытку, общий зависел бы от порядка потоков
    std::seed_seq seq{static_cast<std::uint32_t>(seed_),
                      static_cast<std::uint32_t>(seed_ >> 32),
                      block.sequence_number,
                      attempt};
    std::mt19937_64 rng(seq);
    std::bernoulli_distribution corrupt(probability_);

    if (corrupt(rng)) {
        out[0] = static_cast<char>(out[0] ^ 0xFF);
        spdlog::info("Simulating corruption for Chunk {} (attempt {})...", block.sequence_number, attempt);
    }
    return out;
}

auto make_fault_model(const infra::TransferOptions& options, std::uint64_t seed)
    -> std::shared_ptr<FaultModel>
{
    if (options.corruption_probability > 0.0) {
        return std::make_shared<RandomCorruptionFaultModel>(options.corruption_probability, seed);
    }
    return std::make_shared<IdentityFaultModel>();
}

} // namespace blockcopy::core
