#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <span>
#include <vector>
#include "../types.hpp"
#include "../../infra/config/config.hpp"

namespace blockcopy::core {

// Ненадёжный канал записи: bytes -> bytes.
// Вызывается из нескольких рабочих потоков одновременно.
class FaultModel {
public:
    virtual ~FaultModel() = default;

    // attempt начинается с 1
    [[nodiscard]] virtual auto transform(std::span<const char> data,
                                         const BlockDescriptor& block,
                                         std::uint32_t attempt) -> std::vector<char> = 0;
};

class IdentityFaultModel final : public FaultModel {
public:
    [[nodiscard]] auto transform(std::span<const char> data,
                                 const BlockDescriptor& block,
                                 std::uint32_t attempt) -> std::vector<char> override;
};

// Инвертирует первый байт блока с заданной вероятностью.
// Решение зависит только от (seed, номер блока, попытка), не от порядка потоков.
class RandomCorruptionFaultModel final : public FaultModel {
public:
    RandomCorruptionFaultModel(double probability, std::uint64_t seed);

    [[nodiscard]] auto transform(std::span<const char> data,
                                 const BlockDescriptor& block,
                                 std::uint32_t attempt) -> std::vector<char> override;

private:
    double probability_;
    std::uint64_t seed_;
};

// Identity, если corruption_probability == 0
[[nodiscard]] auto make_fault_model(const infra::TransferOptions& options, std::uint64_t seed)
    -> std::shared_ptr<FaultModel>;

} // namespace blockcopy::core
