#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "annotated.hpp"
#include "collection_config.hpp"
#include "data_uri.hpp"
#include "decimal.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "serializer.hpp"
#include "stats.hpp"
#include "svg_renderer.hpp"

namespace ChainBattles {

// Field order below is the order in the emitted JSON.

struct TraitAttribute {
    A<std::string, options::key<"trait_type">> trait;
    std::string value;
};

struct TokenMetadata {
    std::string name;
    std::string description;
    std::string image;
    // Combat records only; omitted from the document otherwise.
    std::optional<std::vector<TraitAttribute>> attributes;
};

using TokenMetadataModel = A<TokenMetadata, options::skip_nulls>;

/// Fills the metadata model for id. The image is the character card wrapped
/// in an SVG data URI.
template<StatRecord S>
constexpr TokenMetadata AssembleMetadata(TokenId id, const S & stats, const CollectionConfig & cfg = DefaultCollection) {
    TokenMetadata meta;
    meta.name = std::string(cfg.name_prefix) + ToDecimalString(id);
    meta.description = std::string(cfg.description);
    meta.image = SvgDataUri::Encode(RenderCharacterSvg(stats, cfg.card));

    if constexpr (CombatStatRecord<S>) {
        meta.attributes = std::vector<TraitAttribute>{
            {std::string("health"),   ToDecimalString(static_cast<std::uint64_t>(stats.health))},
            {std::string("strength"), ToDecimalString(static_cast<std::uint64_t>(stats.strength))},
            {std::string("speed"),    ToDecimalString(static_cast<std::uint64_t>(stats.speed))},
        };
    }
    return meta;
}

/// Compact JSON text of the metadata document.
template<StatRecord S>
constexpr RegistryResult<std::string> BuildMetadataJson(TokenId id, const S & stats, const CollectionConfig & cfg = DefaultCollection) {
    TokenMetadataModel model = AssembleMetadata(id, stats, cfg);
    std::string out;
    if (!Serialize(model, out)) {
        return RegistryError::ENCODING_ERROR;
    }
    return out;
}

/// `data:application/json;base64,...` reference stored in the ledger's URI
/// slot after mint and train.
template<StatRecord S>
constexpr RegistryResult<std::string> BuildTokenUri(TokenId id, const S & stats, const CollectionConfig & cfg = DefaultCollection) {
    auto json = BuildMetadataJson(id, stats, cfg);
    if (!json) {
        return json.error();
    }
    return JsonDataUri::Encode(json.value());
}

} // namespace ChainBattles
