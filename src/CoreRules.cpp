/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "CoreRules.hpp"

namespace {

std::map<int, std::string> ranks(std::initializer_list<std::string> texts) {
    std::map<int, std::string> result;
    auto rank = 1;
    for (const auto &text : texts)
        result.emplace(rank++, text);
    return result;
}

Race human() {
    Race race;
    race.id = "human";
    race.name = "Human";
    race.description = "Adaptable and ambitious, humans are found in every corner of the realm.";
    race.languages = {"Common"};
    race.bonus_language_choices = 1;
    race.flexible_adjustment = FlexibleAdjustment{1, true};
    race.skill_choices = ChoiceSpec{1, {}};
    race.features = {{"Versatile", "You gain proficiency in one skill of your choice."}};
    return race;
}

Race elf() {
    Race race;
    race.id = "elf";
    race.name = "Elf";
    race.description = "Long-lived and keen of sense, elves keep to the old forests.";
    race.languages = {"Common", "Elvish"};
    race.darkvision = 60;
    race.ability_modifiers = {{Ability::Intellect, 1}, {Ability::Endurance, -1}};
    race.skill_proficiencies = {Skill::Perception};
    race.features = {{"Keen Senses", "You have proficiency in the Perception skill."},
                     {"Trance", "You meditate for four hours instead of sleeping."}};
    return race;
}

Race dwarf() {
    Race race;
    race.id = "dwarf";
    race.name = "Dwarf";
    race.description = "Stout folk of the mountain holds.";
    race.speed = 25;
    race.languages = {"Common", "Dwarvish"};
    race.darkvision = 60;
    race.ability_modifiers = {{Ability::Endurance, 1}, {Ability::Agility, -1}};
    race.skill_bonuses = {{Skill::Appraisal, 2}};
    race.features = {{"Stonecunning", "You know the origin of worked stone at a glance."}};
    return race;
}

Ancestry heartlander() {
    Ancestry ancestry;
    ancestry.id = "heartlander";
    ancestry.name = "Heartlander";
    ancestry.race_id = "human";
    ancestry.region = "The Heartlands";
    ancestry.skill_proficiencies = {Skill::Diplomacy};
    ancestry.language_choices = ChoiceSpec{1, {"Halfling", "Dwarvish", "Elvish"}};
    ancestry.features = {{"Crossroads Folk", "You have met travellers of every kind."}};
    return ancestry;
}

Ancestry northlander() {
    Ancestry ancestry;
    ancestry.id = "northlander";
    ancestry.name = "Northlander";
    ancestry.race_id = "human";
    ancestry.region = "The Frozen Reach";
    ancestry.ability_modifiers = {{Ability::Endurance, 1}};
    ancestry.skill_proficiencies = {Skill::Survival};
    ancestry.tool_proficiencies = {"Sailing vessels"};
    ancestry.reputation_modifier = -1;
    return ancestry;
}

Ancestry sylari() {
    Ancestry ancestry;
    ancestry.id = "sylari";
    ancestry.name = "Sylari";
    ancestry.race_id = "elf";
    ancestry.region = "The Silverwood";
    ancestry.ability_modifiers = {{Ability::Wisdom, 1}};
    ancestry.languages = {"Sylvan"};
    ancestry.skill_bonuses = {{Skill::Nature, 1}};
    ancestry.features = {{"Forest Kin", "Beasts of the wood are slow to attack you."}};
    ancestry.reputation_modifier = 1;
    return ancestry;
}

Ancestry duskborn() {
    Ancestry ancestry;
    ancestry.id = "duskborn";
    ancestry.name = "Duskborn";
    ancestry.race_id = "elf";
    ancestry.region = "The Underdark";
    ancestry.ability_modifiers = {{Ability::Agility, 1}};
    ancestry.language_choices = ChoiceSpec{1, {"Undercommon", "Draconic"}};
    ancestry.tool_proficiencies = {"Poisoner's kit"};
    ancestry.reputation_modifier = -1;
    return ancestry;
}

Ancestry ironhold() {
    Ancestry ancestry;
    ancestry.id = "ironhold";
    ancestry.name = "Ironhold";
    ancestry.race_id = "dwarf";
    ancestry.ability_modifiers = {{Ability::Might, 1}};
    ancestry.tool_proficiencies = {"Smith's tools"};
    return ancestry;
}

Ancestry deepdelver() {
    Ancestry ancestry;
    ancestry.id = "deepdelver";
    ancestry.name = "Deepdelver";
    ancestry.race_id = "dwarf";
    ancestry.ability_modifiers = {{Ability::Wisdom, 1}};
    ancestry.language_choices = ChoiceSpec{1, {"Undercommon", "Giant"}};
    ancestry.skill_proficiencies = {Skill::Investigation};
    return ancestry;
}

Profession warrior() {
    Profession profession;
    profession.id = "warrior";
    profession.name = "Warrior";
    profession.description = "Soldiers, guards and sellswords.";
    profession.base_hp = 10;
    profession.feature = Feature{"Battle Hardened", "You know the ways of the battlefield."};
    profession.armor_proficiencies = {"Light armor", "Medium armor", "Shields"};
    profession.weapon_proficiencies = {"Simple weapons", "Martial weapons"};
    profession.skill_choices = ChoiceSpec{2, {"Acrobatics", "Athletics", "Intimidation", "Perception", "Survival"}};
    profession.suggested_paths = {"defense", "martial"};

    Duty fighter;
    fighter.id = "fighter";
    fighter.name = "Fighter";
    fighter.suggested_paths = {"defense", "martial"};
    fighter.armor_proficiencies = {"Heavy armor"};
    fighter.tool_choices = ChoiceSpec{1, {"Smith's tools", "Armorer's tools"}};

    Duty ranger;
    ranger.id = "ranger";
    ranger.name = "Ranger";
    ranger.suggested_paths = {"martial"};
    ranger.weapon_proficiencies = {"Longbow"};
    ranger.skill_choices = ChoiceSpec{1, {"Nature", "Stealth", "Survival"}};

    profession.duties = {fighter, ranger};
    return profession;
}

Profession scholar_profession() {
    Profession profession;
    profession.id = "scholar";
    profession.name = "Scholar";
    profession.description = "Students of lore, magic and history.";
    profession.base_hp = 6;
    profession.feature = Feature{"Researcher", "You know where to look for lost knowledge."};
    profession.weapon_proficiencies = {"Simple weapons"};
    profession.tool_proficiencies = {"Calligrapher's supplies"};
    profession.skill_choices = ChoiceSpec{2, {"Arcana", "History", "Investigation", "Medicine", "Nature"}};
    profession.suggested_paths = {"mystic"};
    return profession;
}

Path defense() {
    Path path;
    path.id = "defense";
    path.name = "Defense";
    path.description = "Stand in harm's way so others don't have to.";
    path.prerequisites = PathPrerequisite{Ability::Endurance, 15, {Ability::Might, Ability::Wisdom}, 13};
    path.primary_bonus = {{Ability::Endurance, 1}};
    path.talent_points_attribute = Ability::Endurance;
    path.attack_bonus_melee = 1;
    path.role = "Protector";
    path.features = {{"Guardian", "Allies next to you gain +1 Defense."}};
    path.talents = {"iron_skin", "shield_wall", "stalwart", "bulwark"};
    return path;
}

Path martial() {
    Path path;
    path.id = "martial";
    path.name = "Martial";
    path.description = "Masters of weapons and the rhythm of battle.";
    path.prerequisites = PathPrerequisite{Ability::Might, 15, {Ability::Agility, Ability::Endurance}, 13};
    path.primary_bonus = {{Ability::Might, 1}};
    path.talent_points_attribute = Ability::Might;
    path.attack_bonus_melee = 1;
    path.attack_bonus_ranged = 1;
    path.role = "Striker";
    path.features = {{"Weapon Training", "You may reroll a natural 1 on an attack once per rest."}};
    path.talents = {"weapon_mastery", "fighting_style", "cleave", "warlord"};
    return path;
}

Path mystic() {
    Path path;
    path.id = "mystic";
    path.name = "Mystic";
    path.description = "Shapers of raw magic.";
    path.prerequisites = PathPrerequisite{Ability::Intellect, 15, {Ability::Wisdom, Ability::Endurance}, 13};
    path.primary_bonus = {{Ability::Intellect, 1}};
    path.talent_points_attribute = Ability::Intellect;
    path.role = "Caster";
    path.spellcasting = true;
    path.features = {{"Spellcrafting", "You can craft and cast spells."}};
    path.talents = {"spellcraft", "arcane_focus", "ward", "archmage"};
    return path;
}

Background scholar_background() {
    Background background;
    background.id = "scholar";
    background.name = "Scholar";
    background.description = "You spent your youth among books.";
    background.skill_proficiencies = {Skill::History, Skill::Investigation};
    background.languages_granted = 1;
    background.equipment = {"Bottle of ink", "Quill", "Small knife", "Letter from a dead colleague"};
    background.feature = Feature{"Library Access", "You can get into most libraries and archives."};
    background.personality.traits = {{1, "I quote obscure texts at every opportunity.", 0, 0},
                                     {2, "I am fascinated by everything I don't understand.", 0, 1}};
    background.personality.ideals = {{1, "Knowledge should be shared freely.", 1, 1},
                                     {2, "Knowledge is power and I will have it.", -1, 0}};
    background.personality.bonds = {{1, "I protect the library that raised me.", 0, 0},
                                    {2, "I seek a book that was stolen from my master.", 0, 0}};
    background.personality.flaws = {{1, "I overlook obvious solutions in favour of clever ones.", 0, 0},
                                    {2, "I will lie to keep a secret I have uncovered.", -1, -1}};
    return background;
}

Background soldier() {
    Background background;
    background.id = "soldier";
    background.name = "Soldier";
    background.description = "You served in an army.";
    background.skill_proficiencies = {Skill::Athletics, Skill::Intimidation};
    background.tool_proficiencies = {"Gaming set"};
    background.equipment = {"Insignia of rank", "Trophy from a fallen enemy"};
    background.feature = Feature{"Military Rank", "Soldiers loyal to your old unit still defer to you."};
    background.personality.traits = {{1, "I am always polite and respectful.", 0, 1},
                                     {2, "I can stare down a hell hound without flinching.", 0, 0}};
    background.personality.ideals = {{1, "I do what I must and obey just authority.", 1, 0},
                                     {2, "In life as in war, the stronger force wins.", -1, 0}};
    background.personality.bonds = {{1, "I would still lay down my life for those I served with.", 0, 0}};
    background.personality.flaws = {{1, "I obey the law, even if the law causes misery.", 0, -1}};
    return background;
}

Talent talent(std::string id, std::string name, int max_rank, std::map<int, std::string> rank_text) {
    Talent talent;
    talent.id = std::move(id);
    talent.name = std::move(name);
    talent.max_rank = max_rank;
    talent.ranks = std::move(rank_text);
    return talent;
}

Talent path_talent(std::string path_id, std::string id, std::string name, int max_rank,
                   std::map<int, std::string> rank_text) {
    auto result = talent(std::move(id), std::move(name), max_rank, std::move(rank_text));
    result.category = TalentCategory::path;
    result.path_id = std::move(path_id);
    return result;
}

// Every path's primary talent scales in steps gated by level.
Talent primary_talent(std::string path_id, std::string id, std::string name, std::map<int, std::string> rank_text) {
    auto result = path_talent(std::move(path_id), std::move(id), std::move(name), 5, std::move(rank_text));
    result.is_primary = true;
    result.prerequisites.level_by_rank = {{3, 5}, {4, 9}, {5, 13}};
    return result;
}

Talent capstone_talent(std::string path_id, std::string id, std::string name, std::string text) {
    auto result = path_talent(std::move(path_id), std::move(id), std::move(name), 1, ranks({std::move(text)}));
    result.is_capstone = true;
    result.prerequisites.all_path_talents = true;
    result.prerequisites.level_by_rank = {{1, 10}};
    return result;
}

std::vector<Talent> general_talents() {
    auto toughness = talent("toughness", "Toughness", 3,
                            ranks({"+2 maximum hit points.", "+4 maximum hit points.", "+6 maximum hit points."}));
    auto keen_mind = talent("keen_mind", "Keen Mind", 2,
                            ranks({"You always know which way is north.", "You recall anything seen in the last month."}));
    keen_mind.prerequisites.abilities = {{Ability::Intellect, 13}};
    auto athlete = talent("athlete", "Athlete", 2, ranks({"Standing up costs 5 feet of movement.", "Climbing costs no extra movement."}));
    athlete.prerequisites.abilities = {{Ability::Might, 13}, {Ability::Agility, 13}};
    athlete.prerequisites.logic = PrerequisiteLogic::any_of;
    return {toughness, keen_mind, athlete};
}

std::vector<Talent> defense_talents() {
    auto iron_skin = primary_talent("defense", "iron_skin", "Iron Skin",
                                    ranks({"+1 Defense.", "+2 Defense.", "+3 Defense.", "+4 Defense.", "+5 Defense."}));
    auto shield_wall = path_talent("defense", "shield_wall", "Shield Wall", 3,
                                   ranks({"Adjacent allies gain +1 Defense.", "Adjacent allies gain +2 Defense.",
                                          "Adjacent allies gain +3 Defense."}));
    shield_wall.prerequisites.level_by_rank = {{2, 3}, {3, 6}};
    auto stalwart = path_talent("defense", "stalwart", "Stalwart", 3,
                                ranks({"Advantage against being knocked prone.", "Immune to being pushed.",
                                       "Immune to fear."}));
    stalwart.prerequisites.required_talents = {"iron_skin"};
    auto bulwark = capstone_talent("defense", "bulwark", "Bulwark", "Once per day, ignore all damage from one attack.");
    return {iron_skin, shield_wall, stalwart, bulwark};
}

std::vector<Talent> martial_talents() {
    auto weapon_mastery = primary_talent("martial", "weapon_mastery", "Weapon Mastery",
                                         ranks({"+1 to attack.", "+1 to attack and damage.", "+2 to attack and damage.",
                                                "+2 to attack, +3 damage.", "+3 to attack, +3 damage."}));
    auto fighting_style = path_talent("martial", "fighting_style", "Fighting Style", 1,
                                      ranks({"You adopt a particular style of fighting."}));
    fighting_style.requires_choice = true;
    fighting_style.choice_type = "fighting_style";
    fighting_style.choice_options = {"Archery", "Defense", "Dueling", "Great Weapon", "Two-Weapon"};
    auto cleave = path_talent("martial", "cleave", "Cleave", 3,
                              ranks({"Excess damage carries to an adjacent foe.", "Cleave twice per turn.",
                                     "Cleave any number of times per turn."}));
    cleave.prerequisites.abilities = {{Ability::Might, 13}};
    cleave.prerequisites.required_talents = {"weapon_mastery"};
    auto warlord = capstone_talent("martial", "warlord", "Warlord", "Allies who can see you gain an extra attack.");
    return {weapon_mastery, fighting_style, cleave, warlord};
}

std::vector<Talent> mystic_talents() {
    auto spellcraft = primary_talent("mystic", "spellcraft", "Spellcraft",
                                     ranks({"Craft first circle spells.", "Craft second circle spells.",
                                            "Craft third circle spells.", "Craft fourth circle spells.",
                                            "Craft fifth circle spells."}));
    auto arcane_focus = path_talent("mystic", "arcane_focus", "Arcane Focus", 3,
                                    ranks({"+1 to spell attacks.", "+2 to spell attacks.", "+3 to spell attacks."}));
    arcane_focus.prerequisites.abilities = {{Ability::Intellect, 15}, {Ability::Wisdom, 15}};
    arcane_focus.prerequisites.logic = PrerequisiteLogic::any_of;
    auto ward = path_talent("mystic", "ward", "Ward", 3,
                            ranks({"A ward absorbs 5 damage.", "A ward absorbs 10 damage.", "A ward absorbs 15 damage."}));
    ward.prerequisites.level_by_rank = {{2, 4}, {3, 8}};
    auto archmage = capstone_talent("mystic", "archmage", "Archmage", "Cast one crafted spell per day for free.");
    return {spellcraft, arcane_focus, ward, archmage};
}

}

std::vector<std::string> core_languages() {
    return {"Common", "Elvish",      "Dwarvish", "Halfling",  "Sylvan",  "Orcish",
            "Giant",  "Undercommon", "Draconic", "Celestial", "Infernal"};
}

std::vector<RulesEntry> core_rules_entries() {
    std::vector<RulesEntry> entries{human(),       elf(),         dwarf(),   heartlander(),
                                    northlander(), sylari(),      duskborn(), ironhold(),
                                    deepdelver(),  warrior(),     scholar_profession(),
                                    defense(),     martial(),     mystic(),  scholar_background(),
                                    soldier()};
    for (auto talents : {general_talents(), defense_talents(), martial_talents(), mystic_talents()})
        for (auto &talent : talents)
            entries.emplace_back(std::move(talent));
    return entries;
}

const RulesCatalog &core_rules() {
    static const RulesCatalog catalog(core_rules_entries(), core_languages());
    return catalog;
}
