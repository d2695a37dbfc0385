#include <catch2/catch_test_macros.hpp>

#include "blueprints/weapon_catalog.hpp"

#include <string>

using namespace scorch;
using namespace scorch::blueprints;

TEST_CASE("Built-in arsenal", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();

    CHECK(catalog.count() == 11);
    CHECK(catalog.count(WeaponKind::Standard) == 3);
    CHECK(catalog.count(WeaponKind::Splitting) == 2);
    CHECK(catalog.count(WeaponKind::Rolling) == 2);
    CHECK(catalog.count(WeaponKind::Digging) == 2);
    CHECK(catalog.count(WeaponKind::Nuclear) == 2);
    CHECK(catalog.count(WeaponKind::Special) == 0);

    auto all = catalog.get_all();
    REQUIRE(all.size() == 11);
    CHECK(all.front()->id == "basic-shot");
    CHECK(all.back()->id == "nuke");
}

TEST_CASE("Basic shot is free and unlimited", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();
    const auto* basic = catalog.find("basic-shot");
    REQUIRE(basic != nullptr);
    CHECK(basic->cost == 0);
    CHECK(basic->ammo == -1);
    CHECK(basic->damage == 25.0f);
    CHECK(basic->blast_radius == 30.0f);
    CHECK(basic->kind() == WeaponKind::Standard);
    CHECK(basic->effective_direct_hit_multiplier() == 1.5f);

    auto def = catalog.default_weapon();
    REQUIRE(def);
    CHECK(def->id == "basic-shot");
}

TEST_CASE("Behaviour parameters of the special weapons", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();

    const auto* mirv = catalog.find("mirv");
    REQUIRE(mirv != nullptr);
    auto* split = std::get_if<SplittingBehavior>(&mirv->behavior);
    REQUIRE(split != nullptr);
    CHECK(split->split_count == 5);
    CHECK(split->split_angle == 30.0f);

    const auto* deaths_head = catalog.find("deaths-head");
    REQUIRE(deaths_head != nullptr);
    CHECK(std::get<SplittingBehavior>(deaths_head->behavior).split_count == 9);
    CHECK(deaths_head->visuals.projectile_color == 0xff00ffu);
    CHECK(deaths_head->visuals.trail_color == 0xcc00ccu);

    const auto* roller = catalog.find("roller");
    REQUIRE(roller != nullptr);
    CHECK(std::get<RollingBehavior>(roller->behavior).roll_timeout_ms == 3000.0);

    const auto* heavy_digger = catalog.find("heavy-digger");
    REQUIRE(heavy_digger != nullptr);
    auto dig = std::get<DiggingBehavior>(heavy_digger->behavior);
    CHECK(dig.tunnel_distance == 150.0f);
    CHECK(dig.tunnel_radius == 15.0f);

    const auto* nuke = catalog.find("nuke");
    REQUIRE(nuke != nullptr);
    CHECK(nuke->damage == 100.0f);
    CHECK(nuke->blast_radius == 150.0f);
    CHECK(nuke->visuals.screen_shake);
    CHECK(nuke->visuals.screen_flash);
    CHECK(nuke->visuals.mushroom_cloud);

    const auto* mini = catalog.find("mini-nuke");
    REQUIRE(mini != nullptr);
    CHECK_FALSE(mini->visuals.mushroom_cloud);
}

TEST_CASE("Lookups are case-insensitive", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();
    CHECK(catalog.find("MIRV") == catalog.find("mirv"));
    CHECK(catalog.contains("Heavy-Roller"));
    CHECK(catalog.find("death-ray") == nullptr);
    CHECK(catalog.find_shared("death-ray") == nullptr);
}

TEST_CASE("Purchasable weapons exclude the free one", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();
    auto shop = catalog.get_purchasable();
    CHECK(shop.size() == 10);
    for (const auto* def : shop) {
        CHECK(def->cost > 0);
    }
}

TEST_CASE("Get by kind keeps registration order", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();
    auto rollers = catalog.get_by_kind(WeaponKind::Rolling);
    REQUIRE(rollers.size() == 2);
    CHECK(rollers[0]->id == "roller");
    CHECK(rollers[1]->id == "heavy-roller");
}

TEST_CASE("Adding replaces in place", "[catalog]") {
    auto catalog = WeaponCatalog::with_builtin_weapons();
    auto before = catalog.find_shared("missile");

    WeaponDef def;
    def.id = "Missile";
    def.name = "Better Missile";
    def.damage = 99;
    catalog.add(def);

    CHECK(catalog.count() == 11);
    CHECK(catalog.find("missile")->damage == 99.0f);
    CHECK(catalog.get_all()[1]->id == "missile");
    // Shots already holding the old record keep it
    CHECK(before->damage == 35.0f);
}

TEST_CASE("Weapons without an id are rejected", "[catalog]") {
    WeaponCatalog catalog;
    WeaponDef def;
    def.name = "Nameless";
    catalog.add(def);
    CHECK(catalog.count() == 0);
    CHECK(catalog.default_weapon() == nullptr);
}

TEST_CASE("Default weapon without a basic shot", "[catalog]") {
    WeaponCatalog catalog;
    WeaponDef def;
    def.id = "pea-shooter";
    catalog.add(def);
    REQUIRE(catalog.default_weapon());
    CHECK(catalog.default_weapon()->id == "pea-shooter");
}

TEST_CASE("Weapon kind names", "[catalog]") {
    WeaponKind kind = WeaponKind::Standard;
    CHECK(parse_weapon_kind("Digging", kind));
    CHECK(kind == WeaponKind::Digging);
    CHECK_FALSE(parse_weapon_kind("laser", kind));
    CHECK(kind == WeaponKind::Digging);
    CHECK(std::string(weapon_kind_name(WeaponKind::Nuclear)) == "nuclear");
}
