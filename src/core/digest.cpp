#include <tabula/core/digest.hpp>
#include <tabula/core/error.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <array>

namespace tabula {

struct Sha256::State {
    EVP_MD_CTX* ctx = nullptr;
    bool finished = false;

    State() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            ctx = nullptr;
            throw Error("sha256: failed to initialise digest context");
        }
    }
    ~State() { EVP_MD_CTX_free(ctx); }

    State(const State&) = delete;
    auto operator=(const State&) -> State& = delete;
};

Sha256::Sha256() : state_(std::make_unique<State>()) {}
Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
auto Sha256::operator=(Sha256&&) noexcept -> Sha256& = default;

void Sha256::update(std::string_view bytes) {
    if (state_->finished) {
        throw Error("sha256: update after hexdigest");
    }
    if (EVP_DigestUpdate(state_->ctx, bytes.data(), bytes.size()) != 1) {
        throw Error("sha256: digest update failed");
    }
}

void Sha256::update_field(std::string_view bytes) {
    update_u64(bytes.size());
    update(bytes);
}

void Sha256::update_u64(std::uint64_t value) {
    std::array<char, 8> buf{};
    for (std::size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<char>((value >> (8 * i)) & 0xffU);
    }
    update(std::string_view(buf.data(), buf.size()));
}

auto Sha256::hexdigest() -> std::string {
    if (state_->finished) {
        throw Error("sha256: hexdigest called twice");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(state_->ctx, md.data(), &len) != 1) {
        throw Error("sha256: digest finalisation failed");
    }
    state_->finished = true;
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += fmt::format("{:02x}", md[i]);
    }
    return out;
}

}  // namespace tabula
