/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace palsav::gvas {
enum class PolicyAction { Skip, StructHint, Decode };

enum class DomainDecoder { GroupRecords, CharacterRecord };

/**
 * A rule matches the trailing segments of a dotted property path. Each
 * pattern segment is compared with the corresponding path segment exactly,
 * except that a segment starting with '*' matches any path segment ending
 * with the rest of it ("*SaveData" matches "WorkSaveData").
 */
struct PolicyRule {
    std::string pattern;
    PolicyAction action = PolicyAction::Skip;
    std::string struct_hint;
    DomainDecoder decoder = DomainDecoder::GroupRecords;
};

class PolicyTable {
   public:
    explicit PolicyTable(std::vector<PolicyRule> rules);

    static const PolicyTable& defaults();

    bool should_skip(std::string_view path) const;
    // Struct type of a map key/value at "<map path>.Key" or "<map path>.Value".
    // "" means a nested property scope.
    std::optional<std::string> struct_hint(std::string_view path) const;
    std::optional<DomainDecoder> decoder_for(std::string_view path) const;

    const std::vector<PolicyRule>& rules() const { return rules_; }

   private:
    const PolicyRule* first_match(std::string_view path, PolicyAction action) const;

    std::vector<PolicyRule> rules_;
    std::vector<std::vector<std::string>> segments_;
};

bool path_matches(std::string_view pattern, std::string_view path);
}  // namespace palsav::gvas
