#pragma once

#include "blueprints/weapon_def.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scorch::blueprints {

/// Id of the free, unlimited-ammo weapon every tank starts with.
constexpr const char* DEFAULT_WEAPON_ID = "basic-shot";

/// Central registry of weapon records.
/// Records are frozen once added; projectiles keep a shared reference so a
/// later replacement of the same id never invalidates a shot in flight.
class WeaponCatalog {
public:
    WeaponCatalog() = default;

    /// Catalog pre-filled with the stock arsenal (basic shot through nuke).
    static WeaponCatalog with_builtin_weapons();

    /// Register a weapon. An existing record with the same id is replaced
    /// in place (keeps its position in get_all()).
    void add(WeaponDef def);

    /// Find a weapon by id (case-insensitive). Returns nullptr if not found.
    const WeaponDef* find(std::string_view id) const;

    /// Same lookup, sharing ownership of the frozen record.
    std::shared_ptr<const WeaponDef> find_shared(std::string_view id) const;

    bool contains(std::string_view id) const { return find(id) != nullptr; }

    /// The basic shot if registered, otherwise the first weapon added.
    /// nullptr only for an empty catalog.
    std::shared_ptr<const WeaponDef> default_weapon() const;

    /// All weapons in registration order.
    std::vector<const WeaponDef*> get_all() const;

    std::vector<const WeaponDef*> get_by_kind(WeaponKind kind) const;

    /// Weapons that cost money (everything except the free default).
    std::vector<const WeaponDef*> get_purchasable() const;

    size_t count() const { return weapons_.size(); }
    size_t count(WeaponKind kind) const;

    /// Log statistics about registered weapons.
    void log_statistics() const;

private:
    static std::string normalize_id(std::string_view id);

    std::unordered_map<std::string, std::shared_ptr<const WeaponDef>> weapons_;
    std::vector<std::string> order_;
};

} // namespace scorch::blueprints
