#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tabula {

/// Incremental SHA-256 digest producing a lowercase hex string.
class Sha256 {
   public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    auto operator=(const Sha256&) -> Sha256& = delete;
    Sha256(Sha256&&) noexcept;
    auto operator=(Sha256&&) noexcept -> Sha256&;

    void update(std::string_view bytes);
    /// Length-prefixed update, so that adjacent fields can not run into each other.
    void update_field(std::string_view bytes);
    void update_u64(std::uint64_t value);

    /// Finishes the digest; further updates are errors.
    [[nodiscard]] auto hexdigest() -> std::string;

   private:
    struct State;
    std::unique_ptr<State> state_;
};

}  // namespace tabula
