#pragma once

#include <string>
#include <string_view>

namespace ChainBattles {

// Text printed on the character card.
struct CharacterCardConfig {
    std::string_view title       = "Warrior";
    std::string_view level_label = "Levels: ";
};

// Collection-wide constants that end up in every token's metadata.
struct CollectionConfig {
    std::string_view name_prefix = "Chain Battles #";
    std::string_view description = "Battles on chain";
    CharacterCardConfig card{};
};

inline constexpr CollectionConfig DefaultCollection{};

// Owned copy of a CollectionConfig. view() stays valid as long as this object
// does, whatever the lifetime of the texts it was built from.
class CollectionTexts {
    std::string m_namePrefix;
    std::string m_description;
    std::string m_cardTitle;
    std::string m_levelLabel;

public:
    explicit CollectionTexts(const CollectionConfig & config = DefaultCollection):
        m_namePrefix(config.name_prefix),
        m_description(config.description),
        m_cardTitle(config.card.title),
        m_levelLabel(config.card.level_label)
    {}

    CollectionTexts(const CollectionTexts&) = delete;
    CollectionTexts& operator=(const CollectionTexts&) = delete;

    CollectionConfig view() const {
        return CollectionConfig{m_namePrefix, m_description, {m_cardTitle, m_levelLabel}};
    }
};

} // namespace ChainBattles
