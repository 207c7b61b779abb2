#include "cce/persistence/state_serializer.hpp"

#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cce/foundation/game_logger.hpp"
#include "cce/persistence/yaml_codec.hpp"

namespace cce::persistence {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;

namespace {

GameResult<void> invalid(const std::string& message) {
    return GameResult<void>::err(GameError(ErrorCode::SnapshotInvalid, message));
}

bool isList(const YAML::Node& root, const char* key) {
    auto node = root[key];
    return !node || node.IsSequence();
}

}  // namespace

YAML::Node StateSerializer::save(const combat::WeaponRegistry& registry,
                                 const combat::CraftingEngine* crafting) {
    YAML::Node root;
    root["version"] = kFormatVersion;

    root["templates"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& [id, tmpl] : registry.Templates()) {
        root["templates"].push_back(encodeTemplate(tmpl));
    }

    root["instances"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& [key, instance] : registry.Instances()) {
        root["instances"].push_back(encodeInstance(instance));
    }

    root["active_effects"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& effect : registry.ActiveEffects()) {
        root["active_effects"].push_back(encodeActiveEffect(effect));
    }
    root["active_sequence"] = registry.ActiveSequence();

    if (crafting != nullptr) {
        root["components"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& [id, component] : crafting->Components()) {
            root["components"].push_back(encodeComponent(component));
        }
        root["crafted_records"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& [key, record] : crafting->Records()) {
            root["crafted_records"].push_back(encodeRecord(record));
        }
        root["craft_counter"] = crafting->CraftCounter();
    }
    return root;
}

GameResult<void> StateSerializer::load(const YAML::Node& snapshot,
                                       combat::WeaponRegistry& registry,
                                       combat::CraftingEngine* crafting) {
    if (!registry.Instances().empty()) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument, "cannot load a snapshot over existing instances"));
    }

    // Decode and validate everything before the engines are touched, so a
    // rejected snapshot leaves them exactly as they were.
    std::vector<combat::WeaponTemplate> templates;
    std::vector<combat::Component> components;
    std::vector<combat::WeaponInstance> instances;
    std::vector<combat::ActiveEffect> effects;
    std::vector<combat::CraftedWeaponRecord> records;
    std::optional<uint64_t> activeSequence;
    std::optional<uint64_t> craftCounter;

    try {
        if (!snapshot.IsMap()) {
            return invalid("snapshot root must be a map");
        }
        if (!snapshot["version"] || snapshot["version"].as<int>() != kFormatVersion) {
            return invalid("unsupported snapshot version");
        }
        for (const char* key : {"templates", "instances", "active_effects", "components",
                                "crafted_records"}) {
            if (!isList(snapshot, key)) {
                return invalid(std::string("'") + key + "' must be a list");
            }
        }

        std::set<foundation::TemplateId> knownTemplates;
        for (const auto& [id, tmpl] : registry.Templates()) {
            knownTemplates.insert(id);
        }
        std::set<foundation::TemplateId> snapshotTemplates;
        for (const auto& node : snapshot["templates"]) {
            auto tmpl = decodeTemplate(node);
            if (tmpl.hasError()) {
                return GameResult<void>::err(tmpl.error());
            }
            if (!snapshotTemplates.insert(tmpl.value().id).second) {
                return invalid("template '" + tmpl.value().id + "' appears twice");
            }
            if (registry.FindTemplate(tmpl.value().id) != nullptr) {
                continue;
            }
            if (auto valid = combat::WeaponRegistry::ValidateTemplate(tmpl.value()); valid.hasError()) {
                return valid;
            }
            knownTemplates.insert(tmpl.value().id);
            templates.push_back(std::move(tmpl.value()));
        }

        if (crafting != nullptr && snapshot["components"]) {
            std::set<foundation::ComponentId> snapshotComponents;
            for (const auto& node : snapshot["components"]) {
                auto component = decodeComponent(node);
                if (component.hasError()) {
                    return GameResult<void>::err(component.error());
                }
                if (!snapshotComponents.insert(component.value().id).second) {
                    return invalid("component '" + component.value().id + "' appears twice");
                }
                if (crafting->FindComponent(component.value().id) != nullptr) {
                    continue;
                }
                if (auto valid = combat::CraftingEngine::ValidateComponent(component.value());
                    valid.hasError()) {
                    return valid;
                }
                components.push_back(std::move(component.value()));
            }
        }

        std::set<combat::WeaponKey> keys;
        for (const auto& node : snapshot["instances"]) {
            auto instance = decodeInstance(node);
            if (instance.hasError()) {
                return GameResult<void>::err(instance.error());
            }
            if (knownTemplates.count(instance.value().templateId) == 0) {
                return invalid("instance refers to unknown template '"
                               + instance.value().templateId + "'");
            }
            if (!keys.insert(instance.value().Key()).second) {
                return invalid("instance " + combat::toString(instance.value().Key())
                               + " appears twice");
            }
            instances.push_back(std::move(instance.value()));
        }

        if (snapshot["active_effects"]) {
            for (const auto& node : snapshot["active_effects"]) {
                auto effect = decodeActiveEffect(node);
                if (effect.hasError()) {
                    return GameResult<void>::err(effect.error());
                }
                effects.push_back(std::move(effect.value()));
            }
        }
        if (snapshot["active_sequence"]) {
            activeSequence = snapshot["active_sequence"].as<uint64_t>();
        }

        if (crafting != nullptr) {
            if (snapshot["crafted_records"]) {
                for (const auto& node : snapshot["crafted_records"]) {
                    auto record = decodeRecord(node);
                    if (record.hasError()) {
                        return GameResult<void>::err(record.error());
                    }
                    combat::WeaponKey key{record.value().player, record.value().weaponId};
                    if (keys.count(key) == 0) {
                        return invalid("crafted record for missing instance " + combat::toString(key));
                    }
                    records.push_back(std::move(record.value()));
                }
            }
            if (snapshot["craft_counter"]) {
                craftCounter = snapshot["craft_counter"].as<uint64_t>();
            }
        }
    } catch (const YAML::Exception& e) {
        return invalid(std::string("malformed snapshot: ") + e.what());
    }

    // Commit. Every step below was validated above.
    for (auto& tmpl : templates) {
        if (auto r = registry.RegisterTemplate(std::move(tmpl)); r.hasError()) {
            return r;
        }
    }
    for (auto& component : components) {
        if (auto r = crafting->RegisterComponent(std::move(component)); r.hasError()) {
            return r;
        }
    }
    for (auto& instance : instances) {
        if (auto r = registry.RestoreInstance(std::move(instance)); r.hasError()) {
            return r;
        }
    }
    for (auto& effect : effects) {
        registry.RestoreActiveEffect(std::move(effect));
    }
    if (activeSequence) {
        registry.SetActiveSequence(*activeSequence);
    }
    for (auto& record : records) {
        if (auto r = crafting->RestoreRecord(std::move(record)); r.hasError()) {
            return r;
        }
    }
    if (craftCounter) {
        crafting->SetCraftCounter(*craftCounter);
    }

    CCE_LOG_INFO(LogCategory::Persistence,
                 "restored " + std::to_string(registry.Instances().size()) + " weapon instances");
    return GameResult<void>::ok();
}

GameResult<void> StateSerializer::saveToFile(const std::filesystem::path& path,
                                             const combat::WeaponRegistry& registry,
                                             const combat::CraftingEngine* crafting) {
    YAML::Emitter out;
    out << save(registry, crafting);
    if (!out.good()) {
        return invalid(std::string("failed to emit snapshot: ") + out.GetLastError());
    }

    std::ofstream file(path);
    if (!file) {
        return invalid("failed to open " + path.string() + " for writing");
    }
    file << out.c_str() << '\n';
    if (!file) {
        return invalid("failed to write " + path.string());
    }
    CCE_LOG_INFO(LogCategory::Persistence, "saved snapshot to " + path.string());
    return GameResult<void>::ok();
}

GameResult<void> StateSerializer::loadFromFile(const std::filesystem::path& path,
                                               combat::WeaponRegistry& registry,
                                               combat::CraftingEngine* crafting) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return invalid("failed to open snapshot: " + path.string());
    } catch (const YAML::ParserException& e) {
        return invalid(path.string() + ": YAML parse error: " + e.what());
    }
    return load(root, registry, crafting);
}

}  // namespace cce::persistence
