#include "blueprints/weapon_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace scorch::blueprints {

const char* weapon_kind_name(WeaponKind kind) {
    switch (kind) {
    case WeaponKind::Standard: return "standard";
    case WeaponKind::Splitting: return "splitting";
    case WeaponKind::Rolling: return "rolling";
    case WeaponKind::Digging: return "digging";
    case WeaponKind::Nuclear: return "nuclear";
    case WeaponKind::Special: return "special";
    }
    return "unknown";
}

bool parse_weapon_kind(std::string_view name, WeaponKind& out) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    static const std::pair<const char*, WeaponKind> kinds[] = {
        {"standard", WeaponKind::Standard},
        {"splitting", WeaponKind::Splitting},
        {"rolling", WeaponKind::Rolling},
        {"digging", WeaponKind::Digging},
        {"nuclear", WeaponKind::Nuclear},
        {"special", WeaponKind::Special},
    };
    for (const auto& [kind_name, kind] : kinds) {
        if (key == kind_name) {
            out = kind;
            return true;
        }
    }
    return false;
}

WeaponKind WeaponDef::kind() const {
    struct KindOf {
        WeaponKind operator()(const StandardBehavior&) const { return WeaponKind::Standard; }
        WeaponKind operator()(const SplittingBehavior&) const { return WeaponKind::Splitting; }
        WeaponKind operator()(const RollingBehavior&) const { return WeaponKind::Rolling; }
        WeaponKind operator()(const DiggingBehavior&) const { return WeaponKind::Digging; }
        WeaponKind operator()(const NuclearBehavior&) const { return WeaponKind::Nuclear; }
        WeaponKind operator()(const SpecialBehavior&) const { return WeaponKind::Special; }
    };
    return std::visit(KindOf{}, behavior);
}

namespace {

WeaponDef make_weapon(const char* id, const char* name, i32 cost, i32 ammo,
                      f32 damage, f32 blast_radius, const char* description,
                      WeaponBehavior behavior = StandardBehavior{}) {
    WeaponDef def;
    def.id = id;
    def.name = name;
    def.cost = cost;
    def.ammo = ammo;
    def.damage = damage;
    def.blast_radius = blast_radius;
    def.description = description;
    def.behavior = behavior;
    return def;
}

} // namespace

WeaponCatalog WeaponCatalog::with_builtin_weapons() {
    WeaponCatalog catalog;

    // Standard
    catalog.add(make_weapon("basic-shot", "Basic Shot", 0, -1, 25, 30,
                            "Default weapon with unlimited ammo"));
    catalog.add(make_weapon("missile", "Missile", 500, 5, 35, 40,
                            "Standard upgrade with increased damage"));
    catalog.add(make_weapon("big-shot", "Big Shot", 1000, 3, 50, 55,
                            "High damage explosive"));

    // Splitting (damage is per warhead)
    catalog.add(make_weapon("mirv", "MIRV", 3000, 2, 20, 25,
                            "Splits into 5 warheads at apex",
                            SplittingBehavior{5, 30.0f}));
    {
        auto deaths_head = make_weapon(
            "deaths-head", "Death's Head", 5000, 1, 15, 20,
            "Splits into 9 warheads at apex - massive area denial",
            SplittingBehavior{9, 45.0f});
        deaths_head.visuals.projectile_color = 0xff00ff;
        deaths_head.visuals.trail_color = 0xcc00cc;
        catalog.add(std::move(deaths_head));
    }

    // Rolling
    catalog.add(make_weapon("roller", "Roller", 1500, 3, 30, 35,
                            "Rolls down slopes after landing",
                            RollingBehavior{3000.0}));
    catalog.add(make_weapon("heavy-roller", "Heavy Roller", 2500, 2, 45, 45,
                            "Heavier roller with increased damage",
                            RollingBehavior{3000.0}));

    // Digging
    catalog.add(make_weapon("digger", "Digger", 2000, 3, 25, 25,
                            "Tunnels through terrain",
                            DiggingBehavior{100.0f, 10.0f}));
    catalog.add(make_weapon("heavy-digger", "Heavy Digger", 3500, 2, 40, 35,
                            "Deeper tunneling with more damage",
                            DiggingBehavior{150.0f, 15.0f}));

    // Nuclear
    {
        auto mini_nuke = make_weapon("mini-nuke", "Mini Nuke", 4000, 2, 60, 80,
                                     "Small nuclear warhead",
                                     NuclearBehavior{});
        mini_nuke.visuals.screen_shake = true;
        mini_nuke.visuals.screen_flash = true;
        catalog.add(std::move(mini_nuke));
    }
    {
        auto nuke = make_weapon("nuke", "Nuke", 8000, 1, 100, 150,
                                "Massive nuclear explosion", NuclearBehavior{});
        nuke.visuals.screen_shake = true;
        nuke.visuals.screen_flash = true;
        nuke.visuals.mushroom_cloud = true;
        catalog.add(std::move(nuke));
    }

    return catalog;
}

std::string WeaponCatalog::normalize_id(std::string_view id) {
    std::string key(id);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return key;
}

void WeaponCatalog::add(WeaponDef def) {
    std::string key = normalize_id(def.id);
    if (key.empty()) {
        spdlog::warn("Weapon '{}' has no id, skipping", def.name);
        return;
    }
    def.id = key;

    auto it = weapons_.find(key);
    if (it != weapons_.end()) {
        spdlog::debug("Weapon '{}' redefined", key);
    } else {
        order_.push_back(key);
    }
    weapons_[key] = std::make_shared<const WeaponDef>(std::move(def));
}

const WeaponDef* WeaponCatalog::find(std::string_view id) const {
    auto it = weapons_.find(normalize_id(id));
    return (it != weapons_.end()) ? it->second.get() : nullptr;
}

std::shared_ptr<const WeaponDef> WeaponCatalog::find_shared(
    std::string_view id) const {
    auto it = weapons_.find(normalize_id(id));
    return (it != weapons_.end()) ? it->second : nullptr;
}

std::shared_ptr<const WeaponDef> WeaponCatalog::default_weapon() const {
    if (auto basic = find_shared(DEFAULT_WEAPON_ID)) return basic;
    if (order_.empty()) return nullptr;
    return weapons_.at(order_.front());
}

std::vector<const WeaponDef*> WeaponCatalog::get_all() const {
    std::vector<const WeaponDef*> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(weapons_.at(id).get());
    }
    return result;
}

std::vector<const WeaponDef*> WeaponCatalog::get_by_kind(WeaponKind kind) const {
    std::vector<const WeaponDef*> result;
    for (const auto* def : get_all()) {
        if (def->kind() == kind) result.push_back(def);
    }
    return result;
}

std::vector<const WeaponDef*> WeaponCatalog::get_purchasable() const {
    std::vector<const WeaponDef*> result;
    for (const auto* def : get_all()) {
        if (def->cost > 0) result.push_back(def);
    }
    return result;
}

size_t WeaponCatalog::count(WeaponKind kind) const {
    size_t c = 0;
    for (const auto& [id, def] : weapons_) {
        if (def->kind() == kind) c++;
    }
    return c;
}

void WeaponCatalog::log_statistics() const {
    spdlog::info("Weapon catalog:");
    spdlog::info("  Standard:   {}", count(WeaponKind::Standard));
    spdlog::info("  Splitting:  {}", count(WeaponKind::Splitting));
    spdlog::info("  Rolling:    {}", count(WeaponKind::Rolling));
    spdlog::info("  Digging:    {}", count(WeaponKind::Digging));
    spdlog::info("  Nuclear:    {}", count(WeaponKind::Nuclear));
    spdlog::info("  Special:    {}", count(WeaponKind::Special));
    spdlog::info("  Total:      {}", count());
}

} // namespace scorch::blueprints
