#pragma once

#include <colmat/core/block.hpp>

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace colmat {

/// BlockValueSet over vectors held in memory.
///
/// Used to feed transforms from embedding code, the bench tool and tests.
/// Dictionary-encoded sets keep their ids and also decode them once at
/// construction so that values_sv()/values_mv() work as for plain sets.
class MemoryValueSet final : public BlockValueSet {
   public:
    using SvData = std::variant<std::vector<std::int32_t>, std::vector<std::int64_t>,
                                std::vector<float>, std::vector<double>, std::vector<Decimal>,
                                std::vector<std::string>, std::vector<Bytes>>;
    using MvData =
        std::variant<std::vector<std::vector<std::int32_t>>, std::vector<std::vector<std::int64_t>>,
                     std::vector<std::vector<float>>, std::vector<std::vector<double>>,
                     std::vector<std::vector<Decimal>>, std::vector<std::vector<std::string>>,
                     std::vector<std::vector<Bytes>>>;

    /// Restricts construction to the factories below.
    class Passkey {
        friend class MemoryValueSet;
        Passkey() = default;
    };

    MemoryValueSet(Passkey /*key*/, DataType type, NullMask nulls)
        : type_(type), nulls_(std::move(nulls)) {}

    template <StoredValue T>
    [[nodiscard]] static auto single_value(std::vector<T> values, NullMask nulls = {},
                                           DataType type = stored_type_of_v<T>)
        -> std::shared_ptr<MemoryValueSet> {
        auto set = std::make_shared<MemoryValueSet>(Passkey{}, type, std::move(nulls));
        set->check_type(stored_type_of_v<T>);
        set->sv_.emplace(std::move(values));
        return set;
    }

    template <StoredValue T>
    [[nodiscard]] static auto multi_value(std::vector<std::vector<T>> values, NullMask nulls = {},
                                          DataType type = stored_type_of_v<T>)
        -> std::shared_ptr<MemoryValueSet> {
        auto set = std::make_shared<MemoryValueSet>(Passkey{}, type, std::move(nulls));
        set->check_type(stored_type_of_v<T>);
        set->mv_.emplace(std::move(values));
        return set;
    }

    [[nodiscard]] static auto dictionary_sv(std::shared_ptr<const Dictionary> dictionary,
                                            std::vector<std::int32_t> ids, NullMask nulls = {})
        -> std::shared_ptr<MemoryValueSet>;

    [[nodiscard]] static auto dictionary_mv(std::shared_ptr<const Dictionary> dictionary,
                                            std::vector<std::vector<std::int32_t>> ids,
                                            NullMask nulls = {}) -> std::shared_ptr<MemoryValueSet>;

    [[nodiscard]] auto data_type() const noexcept -> DataType override { return type_; }
    [[nodiscard]] auto is_single_value() const noexcept -> bool override { return sv_.has_value(); }
    [[nodiscard]] auto dictionary() const noexcept -> const Dictionary* override {
        return dictionary_.get();
    }

    [[nodiscard]] auto dictionary_ids_sv() const -> std::span<const std::int32_t> override;
    [[nodiscard]] auto dictionary_ids_mv() const
        -> std::span<const std::vector<std::int32_t>> override;

    [[nodiscard]] auto values_sv() const -> SvView override;
    [[nodiscard]] auto values_mv() const -> MvView override;

    [[nodiscard]] auto null_mask() const -> NullMask override { return nulls_; }

   private:
    void check_type(DataType stored) const;

    DataType type_;
    NullMask nulls_;
    std::optional<SvData> sv_;
    std::optional<MvData> mv_;
    std::shared_ptr<const Dictionary> dictionary_;
    std::vector<std::int32_t> ids_sv_;
    std::vector<std::vector<std::int32_t>> ids_mv_;
};

}  // namespace colmat
