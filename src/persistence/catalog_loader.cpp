#include "cce/persistence/catalog_loader.hpp"

#include <string>

#include "cce/foundation/game_logger.hpp"
#include "cce/persistence/yaml_codec.hpp"

namespace cce::persistence {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;

namespace {

GameError loadFailed(const std::string& message) {
    return GameError(ErrorCode::CatalogLoadFailed, message);
}

GameResult<YAML::Node> readFile(const std::filesystem::path& path) {
    try {
        return GameResult<YAML::Node>::ok(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<YAML::Node>::err(loadFailed("failed to open catalog: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<YAML::Node>::err(
            loadFailed(path.string() + ": YAML parse error: " + e.what()));
    }
}

GameResult<YAML::Node> readString(std::string_view yaml) {
    try {
        return GameResult<YAML::Node>::ok(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<YAML::Node>::err(loadFailed(std::string("YAML parse error: ") + e.what()));
    }
}

/// Decode every element of root[key] with @p decode.
template <typename T, typename Decode>
GameResult<std::vector<T>> parseList(const YAML::Node& root, const char* key, Decode decode) {
    if (!root.IsMap() || !root[key] || !root[key].IsSequence()) {
        return GameResult<std::vector<T>>::err(
            loadFailed(std::string("catalog has no '") + key + "' list"));
    }
    std::vector<T> out;
    std::size_t index = 0;
    for (const auto& entry : root[key]) {
        auto decoded = decode(entry);
        if (decoded.hasError()) {
            return GameResult<std::vector<T>>::err(loadFailed(
                std::string(key) + "[" + std::to_string(index) + "]: "
                + std::string(decoded.error().message())));
        }
        out.push_back(std::move(decoded.value()));
        ++index;
    }
    return GameResult<std::vector<T>>::ok(std::move(out));
}

GameResult<std::size_t> registerWeapons(const YAML::Node& root, combat::WeaponRegistry& registry) {
    auto parsed = CatalogLoader::parseWeapons(root);
    if (parsed.hasError()) {
        return GameResult<std::size_t>::err(parsed.error());
    }
    std::size_t count = 0;
    for (auto& tmpl : parsed.value()) {
        if (auto r = registry.RegisterTemplate(std::move(tmpl)); r.hasError()) {
            return GameResult<std::size_t>::err(r.error());
        }
        ++count;
    }
    CCE_LOG_INFO(LogCategory::Persistence, "loaded " + std::to_string(count) + " weapon templates");
    return GameResult<std::size_t>::ok(count);
}

GameResult<std::size_t> registerComponents(const YAML::Node& root, combat::CraftingEngine& crafting) {
    auto parsed = CatalogLoader::parseComponents(root);
    if (parsed.hasError()) {
        return GameResult<std::size_t>::err(parsed.error());
    }
    std::size_t count = 0;
    for (auto& component : parsed.value()) {
        if (auto r = crafting.RegisterComponent(std::move(component)); r.hasError()) {
            return GameResult<std::size_t>::err(r.error());
        }
        ++count;
    }
    CCE_LOG_INFO(LogCategory::Persistence, "loaded " + std::to_string(count) + " components");
    return GameResult<std::size_t>::ok(count);
}

}  // namespace

GameResult<std::vector<combat::WeaponTemplate>> CatalogLoader::parseWeapons(const YAML::Node& root) {
    return parseList<combat::WeaponTemplate>(root, "weapons",
                                             [](const YAML::Node& n) { return decodeTemplate(n); });
}

GameResult<std::vector<combat::Component>> CatalogLoader::parseComponents(const YAML::Node& root) {
    return parseList<combat::Component>(root, "components",
                                        [](const YAML::Node& n) { return decodeComponent(n); });
}

GameResult<std::size_t> CatalogLoader::loadWeapons(const std::filesystem::path& path,
                                                   combat::WeaponRegistry& registry) {
    auto root = readFile(path);
    if (root.hasError()) {
        return GameResult<std::size_t>::err(root.error());
    }
    return registerWeapons(root.value(), registry);
}

GameResult<std::size_t> CatalogLoader::loadWeaponsFromString(std::string_view yaml,
                                                             combat::WeaponRegistry& registry) {
    auto root = readString(yaml);
    if (root.hasError()) {
        return GameResult<std::size_t>::err(root.error());
    }
    return registerWeapons(root.value(), registry);
}

GameResult<std::size_t> CatalogLoader::loadComponents(const std::filesystem::path& path,
                                                      combat::CraftingEngine& crafting) {
    auto root = readFile(path);
    if (root.hasError()) {
        return GameResult<std::size_t>::err(root.error());
    }
    return registerComponents(root.value(), crafting);
}

GameResult<std::size_t> CatalogLoader::loadComponentsFromString(std::string_view yaml,
                                                                combat::CraftingEngine& crafting) {
    auto root = readString(yaml);
    if (root.hasError()) {
        return GameResult<std::size_t>::err(root.error());
    }
    return registerComponents(root.value(), crafting);
}

}  // namespace cce::persistence
