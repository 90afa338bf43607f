/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_policy.h"

#include <array>
#include <utility>

namespace palsav::gvas {
namespace {
std::vector<std::string> split_segments(std::string_view path) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto dot = path.find('.', start);
        const auto end = dot == std::string_view::npos ? path.size() : dot;
        if (end > start) {
            out.emplace_back(path.substr(start, end - start));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool segment_matches(std::string_view pattern, std::string_view segment) {
    if (!pattern.empty() && pattern.front() == '*') {
        return ends_with(segment, pattern.substr(1));
    }
    return pattern == segment;
}

bool segments_match(const std::vector<std::string>& pattern, std::string_view path) {
    if (pattern.empty()) {
        return false;
    }
    // Walk the path backwards without allocating.
    std::size_t end = path.size();
    for (auto it = pattern.rbegin(); it != pattern.rend(); ++it) {
        while (end > 0 && path[end - 1] == '.') {
            end--;
        }
        if (end == 0) {
            return false;
        }
        const auto dot = path.rfind('.', end - 1);
        const std::size_t start = dot == std::string_view::npos ? 0 : dot + 1;
        if (!segment_matches(*it, path.substr(start, end - start))) {
            return false;
        }
        end = start;
    }
    return true;
}

PolicyRule skip(std::string pattern) {
    return PolicyRule{std::move(pattern), PolicyAction::Skip, {}, DomainDecoder::GroupRecords};
}

PolicyRule hint(std::string pattern, std::string struct_type) {
    return PolicyRule{
        std::move(pattern), PolicyAction::StructHint, std::move(struct_type),
        DomainDecoder::GroupRecords
    };
}

PolicyRule decode(std::string pattern, DomainDecoder decoder) {
    return PolicyRule{std::move(pattern), PolicyAction::Decode, {}, decoder};
}

std::vector<PolicyRule> default_rules() {
    std::vector<PolicyRule> rules;

    // High-volume subtrees kept as raw bytes. GameTimeSaveData is left out:
    // player summaries read RealDateTimeTicks from it.
    static constexpr std::array<const char*, 22> kSkipped = {
        "FoliageGridSaveDataMap",
        "MapObjectSpawnerInStageSaveData",
        "WorldLocation",
        "WorldRotation",
        "WorldScale3D",
        "EffectMap",
        "ItemContainerSaveData",
        "CharacterContainerSaveData",
        "DynamicItemSaveData",
        "MapObjectSaveData",
        "WorkSaveData",
        "BaseCampSaveData",
        "EnemyCampSaveData",
        "DungeonSaveData",
        "DungeonPointMarkerSaveData",
        "OilrigSaveData",
        "InvaderSaveData",
        "WorkerDirectorSaveData",
        "GuildExtraSaveDataMap",
        "CharacterParameterStorageSaveData",
        "SupplySaveData",
        "InLockerCharacterInstanceIDArray",
    };
    for (const char* name : kSkipped) {
        rules.push_back(skip(name));
    }

    rules.push_back(decode("GroupSaveDataMap", DomainDecoder::GroupRecords));
    rules.push_back(decode("CharacterSaveParameterMap.Value.RawData", DomainDecoder::CharacterRecord));

    static constexpr std::array<const char*, 7> kGuidKeyed = {
        "GroupSaveDataMap",
        "GuildExtraSaveDataMap",
        "SupplyInfos",
        "RewardSaveDataMap",
        "SpawnerDataMapByLevelObjectInstanceId",
        "BaseCampSaveData",
        "InvaderSaveData",
    };
    rules.push_back(hint("CharacterSaveParameterMap.Key", ""));
    rules.push_back(hint("CharacterSaveParameterMap.Value", ""));
    for (const char* name : kGuidKeyed) {
        rules.push_back(hint(std::string(name) + ".Key", "Guid"));
        rules.push_back(hint(std::string(name) + ".Value", ""));
    }
    static constexpr std::array<const char*, 6> kBagKeyed = {
        "ItemContainerSaveData",
        "CharacterContainerSaveData",
        "DynamicItemSaveData",
        "FoliageGridSaveDataMap",
        "MapObjectSpawnerInStageSaveData",
        "InstanceDataMap",
    };
    for (const char* name : kBagKeyed) {
        rules.push_back(hint(std::string(name) + ".Key", ""));
        rules.push_back(hint(std::string(name) + ".Value", ""));
    }
    rules.push_back(hint("*SaveData.Key", ""));
    rules.push_back(hint("*SaveData.Value", ""));
    rules.push_back(hint("*Map.Key", ""));
    rules.push_back(hint("*Map.Value", ""));
    return rules;
}
}  // namespace

PolicyTable::PolicyTable(std::vector<PolicyRule> rules) : rules_(std::move(rules)) {
    segments_.reserve(rules_.size());
    for (const auto& r : rules_) {
        segments_.push_back(split_segments(r.pattern));
    }
}

const PolicyTable& PolicyTable::defaults() {
    static const PolicyTable table(default_rules());
    return table;
}

const PolicyRule* PolicyTable::first_match(std::string_view path, PolicyAction action) const {
    for (std::size_t i = 0; i < rules_.size(); i++) {
        if (rules_[i].action != action) {
            continue;
        }
        if (segments_match(segments_[i], path)) {
            return &rules_[i];
        }
    }
    return nullptr;
}

bool PolicyTable::should_skip(std::string_view path) const {
    return first_match(path, PolicyAction::Skip) != nullptr;
}

std::optional<std::string> PolicyTable::struct_hint(std::string_view path) const {
    const PolicyRule* r = first_match(path, PolicyAction::StructHint);
    if (!r) {
        return std::nullopt;
    }
    return r->struct_hint;
}

std::optional<DomainDecoder> PolicyTable::decoder_for(std::string_view path) const {
    const PolicyRule* r = first_match(path, PolicyAction::Decode);
    if (!r) {
        return std::nullopt;
    }
    return r->decoder;
}

bool path_matches(std::string_view pattern, std::string_view path) {
    return segments_match(split_segments(pattern), path);
}
}  // namespace palsav::gvas
