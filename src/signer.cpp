#include "natscred/signer.hpp"
#include "natscred/errors.hpp"
#include "base64url.hpp"
#include "claims_json.hpp"
#include "token_codec.hpp"

namespace natscred {

namespace {
    internal::json payloadJson(const ClaimSet& claims) {
        auto payload = internal::commonToJson(common(claims));
        payload["nats"] = std::visit([](const auto& c) { return internal::natsToJson(c); }, claims);
        return payload;
    }
}

std::string canonicalPayload(const ClaimSet& claims) {
    // nlohmann::json objects are std::map backed, so keys serialize sorted
    return payloadJson(claims).dump();
}

std::string sign(ClaimSet claims, const KeyMaterial& signer) {
    using namespace internal;

    if (signer.kind() != issuerKind(claims)) {
        throw SigningError("invalid claim data",
                           toString(signer.kind()) + " key cannot issue " +
                           toString(subjectKind(claims)) + " claims");
    }

    auto& data = common(claims);
    data.issuer = signer.publicKey();
    data.id.clear();

    try {
        validate(claims);
    } catch (const std::invalid_argument& e) {
        throw SigningError("invalid claim data", e.what());
    }

    std::string signing_input = base64url_encode(createHeader()) + "." +
                                base64url_encode(canonicalPayload(claims));

    auto signature = signer.sign(asBytes(signing_input));
    return signing_input + "." + base64url_encode(signature);
}

} // namespace natscred
