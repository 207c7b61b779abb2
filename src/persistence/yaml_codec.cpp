/// @file yaml_codec.cpp
/// @brief YAML codecs for templates, components, instances and records.

#include "cce/persistence/yaml_codec.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace cce::persistence {

using namespace cce::combat;
using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;

namespace {

/// Structural decode failure; converted to SnapshotInvalid at the API edge.
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename T, typename Fn>
GameResult<T> guarded(std::string_view what, Fn&& decode) {
    try {
        return GameResult<T>::ok(decode());
    } catch (const CodecError& e) {
        return GameResult<T>::err(GameError(
            ErrorCode::SnapshotInvalid, std::string(what) + ": " + e.what()));
    } catch (const YAML::Exception& e) {
        return GameResult<T>::err(GameError(
            ErrorCode::SnapshotInvalid, std::string(what) + ": " + e.what()));
    }
}

bool present(const YAML::Node& node) {
    return node.IsDefined() && !node.IsNull();
}

template <typename T>
T required(const YAML::Node& node, const char* key) {
    auto child = node[key];
    if (!present(child)) {
        throw CodecError(std::string("missing '") + key + "'");
    }
    return child.as<T>();
}

template <typename T>
void readInto(const YAML::Node& node, const char* key, T& out) {
    auto child = node[key];
    if (present(child)) {
        out = child.as<T>();
    }
}

template <typename T>
void readInto(const YAML::Node& node, const char* key, std::optional<T>& out) {
    auto child = node[key];
    if (present(child)) {
        out = child.as<T>();
    }
}

template <typename E>
E parseName(const YAML::Node& node, std::optional<E> (*parse)(std::string_view),
            std::string_view kind) {
    auto text = node.as<std::string>();
    auto value = parse(text);
    if (!value) {
        throw CodecError("unknown " + std::string(kind) + " '" + text + "'");
    }
    return *value;
}

template <typename E>
std::optional<E> optionalName(const YAML::Node& node, const char* key,
                              std::optional<E> (*parse)(std::string_view),
                              std::string_view kind) {
    auto child = node[key];
    if (!present(child)) {
        return std::nullopt;
    }
    return parseName(child, parse, kind);
}

std::string name(std::string_view text) {
    return std::string(text);
}

// ── Effects ──────────────────────────────────────────────────────────────

void encodePayload(YAML::Node& out, const EffectPayload& payload) {
    if (const auto* d = std::get_if<DamagePayload>(&payload)) {
        out["damage"] = d->damage;
        out["multiplier"] = d->multiplier;
        if (d->damageType) {
            out["damage_type"] = name(toString(*d->damageType));
        }
        out["armor_penetration"] = d->armorPenetration;
        out["max_targets"] = d->maxTargets;
        out["aoe_radius"] = d->aoeRadius;
    } else if (const auto* s = std::get_if<StatusPayload>(&payload)) {
        out["status_type"] = name(toString(s->statusType));
        out["status_duration"] = s->statusDuration;
        out["strength"] = s->strength;
        out["application_chance"] = s->applicationChance;
        out["max_targets"] = s->maxTargets;
    } else if (const auto* u = std::get_if<UtilityPayload>(&payload)) {
        out["utility_type"] = name(toString(u->utilityType));
        if (u->amount) {
            out["amount"] = *u->amount;
        }
        out["percentage"] = u->percentage;
        out["magnitude"] = u->magnitude;
        out["distance"] = u->distance;
        out["direction"] = u->direction;
        out["level"] = u->level;
        out["modifier_duration"] = u->modifierDuration;
        out["range"] = u->range;
        out["max_targets"] = u->maxTargets;
        out["reveal_weakness"] = u->revealWeakness;
    }
}

EffectPayload readPayload(const YAML::Node& node) {
    auto category = optionalName(node, "category", &parseEffectCategory, "effect category");
    if (!category) {
        if (present(node["status_type"])) {
            category = EffectCategory::Status;
        } else if (present(node["utility_type"])) {
            category = EffectCategory::Utility;
        } else {
            category = EffectCategory::Damage;
        }
    }

    switch (*category) {
        case EffectCategory::Damage: {
            DamagePayload d;
            readInto(node, "damage", d.damage);
            readInto(node, "multiplier", d.multiplier);
            d.damageType = optionalName(node, "damage_type", &parseDamageType, "damage type");
            readInto(node, "armor_penetration", d.armorPenetration);
            readInto(node, "max_targets", d.maxTargets);
            readInto(node, "aoe_radius", d.aoeRadius);
            return d;
        }
        case EffectCategory::Status: {
            StatusPayload s;
            s.statusType = parseName(node["status_type"], &parseStatusType, "status type");
            readInto(node, "status_duration", s.statusDuration);
            readInto(node, "strength", s.strength);
            readInto(node, "application_chance", s.applicationChance);
            readInto(node, "max_targets", s.maxTargets);
            return s;
        }
        case EffectCategory::Utility: {
            UtilityPayload u;
            u.utilityType = parseName(node["utility_type"], &parseUtilityType, "utility type");
            readInto(node, "amount", u.amount);
            readInto(node, "percentage", u.percentage);
            readInto(node, "magnitude", u.magnitude);
            readInto(node, "distance", u.distance);
            readInto(node, "direction", u.direction);
            readInto(node, "level", u.level);
            readInto(node, "modifier_duration", u.modifierDuration);
            readInto(node, "range", u.range);
            readInto(node, "max_targets", u.maxTargets);
            readInto(node, "reveal_weakness", u.revealWeakness);
            return u;
        }
    }
    throw CodecError("unhandled effect category");
}

EffectDescriptor readEffect(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw CodecError("effect must be a map");
    }
    EffectDescriptor e;
    e.id = required<std::string>(node, "id");
    readInto(node, "name", e.name);
    readInto(node, "description", e.description);
    e.payload = readPayload(node);

    if (auto c = node["conditions"]; present(c)) {
        readInto(c, "min_charge", e.conditions.minCharge);
        readInto(c, "target_health_below", e.conditions.targetHealthBelowPercent);
        readInto(c, "consecutive_hits", e.conditions.consecutiveHits);
        readInto(c, "enemy_count", e.conditions.enemyCount);
        readInto(c, "requires_critical", e.conditions.requiresCritical);
        readInto(c, "trigger_chance", e.conditions.triggerChance);
    }
    if (auto c = node["cost"]; present(c)) {
        readInto(c, "charge", e.cost.charge);
        readInto(c, "durability", e.cost.durability);
    }
    readInto(node, "cooldown", e.cooldown);
    readInto(node, "duration", e.duration);
    readInto(node, "rarity", e.rarity);
    return e;
}

// ── Stats and evolutions ─────────────────────────────────────────────────

WeaponStats readStats(const YAML::Node& node) {
    WeaponStats stats;
    if (!present(node)) {
        return stats;
    }
    if (!node.IsMap()) {
        throw CodecError("stats must be a map");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        if (key == "damage_type") {
            stats.damageType = parseName(it->second, &parseDamageType, "damage type");
            continue;
        }
        auto field = parseStatField(key);
        if (!field) {
            throw CodecError("unknown stat '" + key + "'");
        }
        stats.Set(*field, it->second.as<double>());
    }
    return stats;
}

std::map<StatField, double> readStatMap(const YAML::Node& node, std::optional<DamageType>& damageType,
                                        std::optional<EffectDescriptor>* newEffect) {
    std::map<StatField, double> out;
    if (!present(node)) {
        return out;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        if (key == "damage_type") {
            damageType = parseName(it->second, &parseDamageType, "damage type");
        } else if (key == "new_effect" && newEffect != nullptr) {
            *newEffect = readEffect(it->second);
        } else if (auto field = parseStatField(key)) {
            out[*field] = it->second.as<double>();
        } else {
            throw CodecError("unknown stat '" + key + "'");
        }
    }
    return out;
}

YAML::Node encodeModification(const EffectModification& mod) {
    YAML::Node n(YAML::NodeType::Map);
    auto put = [&n](const char* key, const auto& value) {
        if (value) {
            n[key] = *value;
        }
    };
    put("name", mod.name);
    put("description", mod.description);
    put("cooldown", mod.cooldown);
    put("duration", mod.duration);
    put("cost_charge", mod.costCharge);
    put("cost_durability", mod.costDurability);
    put("min_charge", mod.minCharge);
    put("trigger_chance", mod.triggerChance);
    put("damage", mod.damage);
    put("multiplier", mod.multiplier);
    if (mod.damageType) {
        n["damage_type"] = name(toString(*mod.damageType));
    }
    put("armor_penetration", mod.armorPenetration);
    put("max_targets", mod.maxTargets);
    put("aoe_radius", mod.aoeRadius);
    put("status_duration", mod.statusDuration);
    put("strength", mod.strength);
    put("application_chance", mod.applicationChance);
    put("amount", mod.amount);
    put("percentage", mod.percentage);
    put("magnitude", mod.magnitude);
    return n;
}

EffectModification readModification(const YAML::Node& node) {
    EffectModification mod;
    readInto(node, "name", mod.name);
    readInto(node, "description", mod.description);
    readInto(node, "cooldown", mod.cooldown);
    readInto(node, "duration", mod.duration);
    readInto(node, "cost_charge", mod.costCharge);
    readInto(node, "cost_durability", mod.costDurability);
    readInto(node, "min_charge", mod.minCharge);
    readInto(node, "trigger_chance", mod.triggerChance);
    readInto(node, "damage", mod.damage);
    readInto(node, "multiplier", mod.multiplier);
    mod.damageType = optionalName(node, "damage_type", &parseDamageType, "damage type");
    readInto(node, "armor_penetration", mod.armorPenetration);
    readInto(node, "max_targets", mod.maxTargets);
    readInto(node, "aoe_radius", mod.aoeRadius);
    readInto(node, "status_duration", mod.statusDuration);
    readInto(node, "strength", mod.strength);
    readInto(node, "application_chance", mod.applicationChance);
    readInto(node, "amount", mod.amount);
    readInto(node, "percentage", mod.percentage);
    readInto(node, "magnitude", mod.magnitude);
    return mod;
}

EvolutionPath readEvolution(const YAML::Node& node) {
    EvolutionPath path;
    path.id = required<std::string>(node, "id");
    readInto(node, "name", path.name);
    readInto(node, "description", path.description);
    readInto(node, "level_requirement", path.levelRequirement);
    readInto(node, "prerequisites", path.prerequisites);
    path.delta.statOverwrites = readStatMap(node["stats"], path.delta.damageType, nullptr);
    if (auto dt = optionalName(node, "damage_type", &parseDamageType, "damage type")) {
        path.delta.damageType = dt;
    }
    if (auto mods = node["effect_modifications"]; present(mods)) {
        for (auto it = mods.begin(); it != mods.end(); ++it) {
            path.delta.effectModifications[it->first.as<std::string>()] = readModification(it->second);
        }
    }
    if (auto ne = node["new_effect"]; present(ne)) {
        path.delta.newEffect = readEffect(ne);
    }
    return path;
}

// ── Templates and components ─────────────────────────────────────────────

WeaponTemplate readTemplate(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw CodecError("weapon template must be a map");
    }
    WeaponTemplate t;
    t.id = required<std::string>(node, "id");
    readInto(node, "name", t.name);
    readInto(node, "description", t.description);
    t.category = optionalName(node, "category", &parseWeaponCategory, "weapon category");
    t.rarity = optionalName(node, "rarity", &parseRarity, "rarity");
    readInto(node, "crafted", t.crafted);
    t.stats = readStats(node["stats"]);
    if (auto effects = node["effects"]; present(effects)) {
        for (const auto& e : effects) {
            t.effects.push_back(readEffect(e));
        }
    }
    if (auto evolutions = node["evolutions"]; present(evolutions)) {
        for (const auto& e : evolutions) {
            t.evolutions.push_back(readEvolution(e));
        }
    }
    return t;
}

Component readComponent(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw CodecError("component must be a map");
    }
    Component c;
    c.id = required<std::string>(node, "id");
    readInto(node, "name", c.name);
    readInto(node, "description", c.description);
    c.category = optionalName(node, "category", &parseComponentCategory, "component category");
    if (auto rarity = optionalName(node, "rarity", &parseRarity, "rarity")) {
        c.rarity = *rarity;
    }
    if (auto compat = node["compatibility"]; present(compat)) {
        for (const auto& entry : compat) {
            c.compatibility.insert(parseName(entry, &parseWeaponCategory, "weapon category"));
        }
    }
    readInto(node, "difficulty", c.craftingDifficulty);
    c.modifiers.deltas = readStatMap(node["modifiers"], c.modifiers.damageType, &c.modifiers.newEffect);
    return c;
}

// ── Runtime state ────────────────────────────────────────────────────────

TargetResult readTargetResult(const YAML::Node& node) {
    TargetResult r;
    r.targetId = required<std::string>(node, "target_id");
    readInto(node, "damage", r.damage);
    readInto(node, "health_remaining", r.healthRemaining);
    readInto(node, "killed", r.killed);
    r.status = optionalName(node, "status", &parseStatusType, "status type");
    readInto(node, "applied", r.applied);
    readInto(node, "application_chance", r.applicationChance);
    r.weakness = optionalName(node, "weakness", &parseDamageType, "damage type");
    readInto(node, "weakness_value", r.weaknessValue);
    return r;
}

YAML::Node encodeTargetResult(const TargetResult& r) {
    YAML::Node n;
    n["target_id"] = r.targetId;
    n["damage"] = r.damage;
    n["health_remaining"] = r.healthRemaining;
    n["killed"] = r.killed;
    if (r.status) {
        n["status"] = name(toString(*r.status));
    }
    n["applied"] = r.applied;
    n["application_chance"] = r.applicationChance;
    if (r.weakness) {
        n["weakness"] = name(toString(*r.weakness));
        n["weakness_value"] = r.weaknessValue;
    }
    return n;
}

}  // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

YAML::Node encodeEffect(const EffectDescriptor& effect) {
    YAML::Node n;
    n["id"] = effect.id;
    n["name"] = effect.name;
    n["description"] = effect.description;
    n["category"] = name(toString(effect.Category()));
    encodePayload(n, effect.payload);

    const auto& c = effect.conditions;
    if (!c.IsEmpty()) {
        YAML::Node cond;
        if (c.minCharge) cond["min_charge"] = *c.minCharge;
        if (c.targetHealthBelowPercent) cond["target_health_below"] = *c.targetHealthBelowPercent;
        if (c.consecutiveHits) cond["consecutive_hits"] = *c.consecutiveHits;
        if (c.enemyCount) cond["enemy_count"] = *c.enemyCount;
        if (c.requiresCritical) cond["requires_critical"] = true;
        if (c.triggerChance) cond["trigger_chance"] = *c.triggerChance;
        n["conditions"] = cond;
    }
    if (effect.cost.charge != 0 || effect.cost.durability != 0) {
        n["cost"]["charge"] = effect.cost.charge;
        n["cost"]["durability"] = effect.cost.durability;
    }
    n["cooldown"] = effect.cooldown;
    n["duration"] = effect.duration;
    n["rarity"] = effect.rarity;
    return n;
}

GameResult<EffectDescriptor> decodeEffect(const YAML::Node& node) {
    return guarded<EffectDescriptor>("effect", [&] { return readEffect(node); });
}

YAML::Node encodeStats(const WeaponStats& stats) {
    YAML::Node n;
    for (std::size_t i = 0; i < kStatFieldCount; ++i) {
        auto field = static_cast<StatField>(i);
        n[name(toString(field))] = stats.Get(field);
    }
    n["damage_type"] = name(toString(stats.damageType));
    return n;
}

GameResult<WeaponStats> decodeStats(const YAML::Node& node) {
    return guarded<WeaponStats>("stats", [&] { return readStats(node); });
}

YAML::Node encodeEvolution(const EvolutionPath& path) {
    YAML::Node n;
    n["id"] = path.id;
    n["name"] = path.name;
    n["description"] = path.description;
    n["level_requirement"] = path.levelRequirement;
    n["prerequisites"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& prereq : path.prerequisites) {
        n["prerequisites"].push_back(prereq);
    }
    if (!path.delta.statOverwrites.empty()) {
        for (const auto& [field, value] : path.delta.statOverwrites) {
            n["stats"][name(toString(field))] = value;
        }
    }
    if (path.delta.damageType) {
        n["damage_type"] = name(toString(*path.delta.damageType));
    }
    for (const auto& [effectId, mod] : path.delta.effectModifications) {
        n["effect_modifications"][effectId] = encodeModification(mod);
    }
    if (path.delta.newEffect) {
        n["new_effect"] = encodeEffect(*path.delta.newEffect);
    }
    return n;
}

GameResult<EvolutionPath> decodeEvolution(const YAML::Node& node) {
    return guarded<EvolutionPath>("evolution", [&] { return readEvolution(node); });
}

YAML::Node encodeTemplate(const WeaponTemplate& tmpl) {
    YAML::Node n;
    n["id"] = tmpl.id;
    n["name"] = tmpl.name;
    n["description"] = tmpl.description;
    if (tmpl.category) {
        n["category"] = name(toString(*tmpl.category));
    }
    if (tmpl.rarity) {
        n["rarity"] = name(toString(*tmpl.rarity));
    }
    if (tmpl.crafted) {
        n["crafted"] = true;
    }
    n["stats"] = encodeStats(tmpl.stats);
    n["effects"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& effect : tmpl.effects) {
        n["effects"].push_back(encodeEffect(effect));
    }
    if (!tmpl.evolutions.empty()) {
        for (const auto& path : tmpl.evolutions) {
            n["evolutions"].push_back(encodeEvolution(path));
        }
    }
    return n;
}

GameResult<WeaponTemplate> decodeTemplate(const YAML::Node& node) {
    return guarded<WeaponTemplate>("weapon template", [&] { return readTemplate(node); });
}

YAML::Node encodeComponent(const Component& component) {
    YAML::Node n;
    n["id"] = component.id;
    n["name"] = component.name;
    n["description"] = component.description;
    if (component.category) {
        n["category"] = name(toString(*component.category));
    }
    n["rarity"] = name(toString(component.rarity));
    n["compatibility"] = YAML::Node(YAML::NodeType::Sequence);
    for (auto category : component.compatibility) {
        n["compatibility"].push_back(name(toString(category)));
    }
    n["difficulty"] = component.craftingDifficulty;

    YAML::Node mods(YAML::NodeType::Map);
    for (const auto& [field, delta] : component.modifiers.deltas) {
        mods[name(toString(field))] = delta;
    }
    if (component.modifiers.damageType) {
        mods["damage_type"] = name(toString(*component.modifiers.damageType));
    }
    if (component.modifiers.newEffect) {
        mods["new_effect"] = encodeEffect(*component.modifiers.newEffect);
    }
    n["modifiers"] = mods;
    return n;
}

GameResult<Component> decodeComponent(const YAML::Node& node) {
    return guarded<Component>("component", [&] { return readComponent(node); });
}

YAML::Node encodeInstance(const WeaponInstance& instance) {
    YAML::Node n;
    n["owner"] = instance.owner.value();
    n["template_id"] = instance.templateId;
    n["current_charge"] = instance.currentCharge;
    n["current_durability"] = instance.currentDurability;
    n["cooldowns"] = YAML::Node(YAML::NodeType::Map);
    for (const auto& [effectId, readyAt] : instance.cooldowns) {
        n["cooldowns"][effectId] = readyAt;
    }

    n["counters"]["kills"] = instance.counters.kills;
    n["counters"]["damage_dealt"] = instance.counters.damageDealt;
    n["counters"]["special_triggers"] = instance.counters.specialTriggers;
    n["counters"]["critical_hits"] = instance.counters.criticalHits;

    const auto& p = instance.progress;
    n["progress"]["level"] = p.level;
    n["progress"]["experience"] = p.experience;
    n["progress"]["next_level_threshold"] = p.nextLevelThreshold;
    n["progress"]["evolutions_available"] = p.evolutionsAvailable;
    n["progress"]["applied_evolutions"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& id : p.appliedEvolutions) {
        n["progress"]["applied_evolutions"].push_back(id);
    }

    n["effective"] = encodeTemplate(instance.effective);
    return n;
}

GameResult<WeaponInstance> decodeInstance(const YAML::Node& node) {
    return guarded<WeaponInstance>("weapon instance", [&] {
        WeaponInstance instance;
        instance.owner = foundation::PlayerId(required<uint64_t>(node, "owner"));
        instance.templateId = required<std::string>(node, "template_id");
        instance.currentCharge = required<int32_t>(node, "current_charge");
        instance.currentDurability = required<int32_t>(node, "current_durability");
        if (auto cds = node["cooldowns"]; present(cds)) {
            for (auto it = cds.begin(); it != cds.end(); ++it) {
                instance.cooldowns[it->first.as<std::string>()] = it->second.as<int64_t>();
            }
        }
        if (auto c = node["counters"]; present(c)) {
            readInto(c, "kills", instance.counters.kills);
            readInto(c, "damage_dealt", instance.counters.damageDealt);
            readInto(c, "special_triggers", instance.counters.specialTriggers);
            readInto(c, "critical_hits", instance.counters.criticalHits);
        }
        auto p = node["progress"];
        if (!present(p)) {
            throw CodecError("missing 'progress'");
        }
        instance.progress.level = required<int32_t>(p, "level");
        instance.progress.experience = required<int64_t>(p, "experience");
        instance.progress.nextLevelThreshold = required<int64_t>(p, "next_level_threshold");
        readInto(p, "evolutions_available", instance.progress.evolutionsAvailable);
        readInto(p, "applied_evolutions", instance.progress.appliedEvolutions);

        auto effective = node["effective"];
        if (!present(effective)) {
            throw CodecError("missing 'effective'");
        }
        instance.effective = readTemplate(effective);

        if (instance.currentCharge < 0 || instance.currentCharge > instance.MaxCharge()) {
            throw CodecError("current_charge outside [0, max_charge]");
        }
        if (instance.currentDurability < 0 || instance.currentDurability > instance.MaxDurability()) {
            throw CodecError("current_durability outside [0, durability]");
        }
        if (instance.progress.level < 1
            || instance.progress.experience >= instance.progress.nextLevelThreshold) {
            throw CodecError("inconsistent progress");
        }
        return instance;
    });
}

YAML::Node encodeActiveEffect(const ActiveEffect& effect) {
    YAML::Node n;
    n["instance_id"] = effect.instanceId;
    n["player"] = effect.player.value();
    n["weapon_id"] = effect.weaponId;
    n["effect_id"] = effect.effectId;
    n["start_time"] = effect.startTime;
    n["end_time"] = effect.endTime;
    n["targets"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& target : effect.targets) {
        n["targets"].push_back(target);
    }
    n["results"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& result : effect.results) {
        n["results"].push_back(encodeTargetResult(result));
    }
    n["snapshot"] = encodeEffect(effect.snapshot);
    return n;
}

GameResult<ActiveEffect> decodeActiveEffect(const YAML::Node& node) {
    return guarded<ActiveEffect>("active effect", [&] {
        ActiveEffect effect;
        effect.instanceId = required<std::string>(node, "instance_id");
        effect.player = foundation::PlayerId(required<uint64_t>(node, "player"));
        effect.weaponId = required<std::string>(node, "weapon_id");
        effect.effectId = required<std::string>(node, "effect_id");
        effect.startTime = required<int64_t>(node, "start_time");
        effect.endTime = required<int64_t>(node, "end_time");
        readInto(node, "targets", effect.targets);
        if (auto results = node["results"]; present(results)) {
            for (const auto& r : results) {
                effect.results.push_back(readTargetResult(r));
            }
        }
        effect.snapshot = readEffect(node["snapshot"]);
        return effect;
    });
}

YAML::Node encodeRecord(const CraftedWeaponRecord& record) {
    YAML::Node n;
    n["player"] = record.player.value();
    n["weapon_id"] = record.weaponId;
    for (const auto& [slot, componentId] : record.components) {
        n["components"][name(toString(slot))] = componentId;
    }
    n["crafted_at"] = record.craftedAt;
    return n;
}

GameResult<CraftedWeaponRecord> decodeRecord(const YAML::Node& node) {
    return guarded<CraftedWeaponRecord>("crafted record", [&] {
        CraftedWeaponRecord record;
        record.player = foundation::PlayerId(required<uint64_t>(node, "player"));
        record.weaponId = required<std::string>(node, "weapon_id");
        auto components = node["components"];
        if (!present(components) || !components.IsMap()) {
            throw CodecError("missing 'components'");
        }
        for (auto it = components.begin(); it != components.end(); ++it) {
            auto slot = parseName(it->first, &parseComponentCategory, "component category");
            record.components[slot] = it->second.as<std::string>();
        }
        readInto(node, "crafted_at", record.craftedAt);
        return record;
    });
}

}  // namespace cce::persistence
