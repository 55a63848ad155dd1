// ---------------------------------------------------------------------------
// environment_loader.cpp
//
// 환경 문서를 로드하여 Environment 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 환경을 반환하지 않는다.
// - 필수 필드(vm_id, tags, source_tag, dest_tag)는 기본값으로 채우지 않는다.
//   누락은 데이터 형식 오류이며 kSchemaError 로 보고한다.
// - vm_id 는 비어 있으면 안 된다. 그 밖의 키(name, fw_id 등)는 무시한다.
// - 문서 전체를 로그에 출력하지 않는다 (대형 환경에서 로그 폭주 방지).
//
// [알려진 한계]
// - yaml-cpp 는 스칼라의 원래 타입을 구분하지 않는다. 숫자 태그(예: 42)도
//   문자열 "42" 로 읽힌다.
// ---------------------------------------------------------------------------

#include "model/environment_loader.hpp"

#include <optional>
#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: LoadError 생성 + 오류 로그 출력
// ---------------------------------------------------------------------------
[[nodiscard]] std::unexpected<LoadError> fail(LoadErrorCode code,
                                              std::string   message,
                                              std::string   context) {
    spdlog::error("environment_loader: {} ({})", message, context);
    return std::unexpected(LoadError{
        .code    = code,
        .message = std::move(message),
        .context = std::move(context),
    });
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 필수 스칼라 필드를 읽는다.
// 노드가 없거나 스칼라가 아니면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> read_required_scalar(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: vms 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<VirtualMachine>, LoadError>
parse_vms(const YAML::Node& vms_node, std::string_view source) {
    if (!vms_node || !vms_node.IsSequence()) {
        return fail(LoadErrorCode::kSchemaError,
                    "'vms' must be a sequence",
                    fmt::format("{}: vms", source));
    }

    std::vector<VirtualMachine> vms;
    vms.reserve(vms_node.size());
    std::unordered_set<std::string> seen_ids;
    seen_ids.reserve(vms_node.size());

    std::size_t index = 0;
    for (const auto& vm_node : vms_node) {
        const std::string where = fmt::format("{}: vms[{}]", source, index);

        if (!vm_node.IsMap()) {
            return fail(LoadErrorCode::kSchemaError, "vm entry must be a map", where);
        }

        auto vm_id = read_required_scalar(vm_node["vm_id"]);
        if (!vm_id) {
            return fail(LoadErrorCode::kSchemaError,
                        "vm entry is missing scalar 'vm_id'", where);
        }
        if (vm_id->empty()) {
            return fail(LoadErrorCode::kSchemaError, "vm entry has an empty 'vm_id'", where);
        }

        const YAML::Node tags_node = vm_node["tags"];
        if (!tags_node || !tags_node.IsSequence()) {
            return fail(LoadErrorCode::kSchemaError,
                        fmt::format("vm '{}' is missing 'tags' sequence", *vm_id), where);
        }

        VirtualMachine vm{};
        vm.vm_id = std::move(*vm_id);
        vm.tags.reserve(tags_node.size());

        std::size_t tag_index = 0;
        for (const auto& tag_node : tags_node) {
            if (!tag_node.IsScalar()) {
                return fail(LoadErrorCode::kSchemaError,
                            fmt::format("vm '{}' has a non-scalar tag", vm.vm_id),
                            fmt::format("{}.tags[{}]", where, tag_index));
            }
            vm.tags.push_back(tag_node.as<std::string>());
            ++tag_index;
        }

        if (!seen_ids.insert(vm.vm_id).second) {
            return fail(LoadErrorCode::kDuplicateVmId,
                        fmt::format("duplicate vm_id '{}'", vm.vm_id), where);
        }

        vms.push_back(std::move(vm));
        ++index;
    }

    return vms;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: fw_rules 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<FirewallRule>, LoadError>
parse_fw_rules(const YAML::Node& rules_node, std::string_view source) {
    if (!rules_node || !rules_node.IsSequence()) {
        return fail(LoadErrorCode::kSchemaError,
                    "'fw_rules' must be a sequence",
                    fmt::format("{}: fw_rules", source));
    }

    std::vector<FirewallRule> rules;
    rules.reserve(rules_node.size());

    std::size_t index = 0;
    for (const auto& rule_node : rules_node) {
        const std::string where = fmt::format("{}: fw_rules[{}]", source, index);

        if (!rule_node.IsMap()) {
            return fail(LoadErrorCode::kSchemaError, "firewall rule must be a map", where);
        }

        auto source_tag = read_required_scalar(rule_node["source_tag"]);
        if (!source_tag) {
            return fail(LoadErrorCode::kSchemaError,
                        "firewall rule is missing scalar 'source_tag'", where);
        }
        auto dest_tag = read_required_scalar(rule_node["dest_tag"]);
        if (!dest_tag) {
            return fail(LoadErrorCode::kSchemaError,
                        "firewall rule is missing scalar 'dest_tag'", where);
        }

        rules.push_back(FirewallRule{
            .source_tag = std::move(*source_tag),
            .dest_tag   = std::move(*dest_tag),
        });
        ++index;
    }

    return rules;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 이미 로드된 루트 노드를 Environment 로 변환
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Environment, LoadError>
parse_root(const YAML::Node& root, std::string_view source) {
    if (!root || !root.IsMap()) {
        return fail(LoadErrorCode::kSchemaError,
                    "document is not a map (top-level)", std::string{source});
    }

    Environment env{};

    try {
        auto vms = parse_vms(root["vms"], source);
        if (!vms) {
            return std::unexpected(std::move(vms.error()));
        }
        env.vms = std::move(*vms);

        auto rules = parse_fw_rules(root["fw_rules"], source);
        if (!rules) {
            return std::unexpected(std::move(rules.error()));
        }
        env.fw_rules = std::move(*rules);
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kSchemaError,
                    fmt::format("YAML error while reading document: {}", e.what()),
                    std::string{source});
    }

    return env;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: yaml-cpp 파서 예외 → LoadError
// ---------------------------------------------------------------------------
[[nodiscard]] std::unexpected<LoadError> syntax_error(const YAML::ParserException& e,
                                                      std::string_view             source) {
    return fail(LoadErrorCode::kSyntaxError,
                fmt::format("parse error at line {}, col {}: {}",
                            e.mark.line + 1,   // yaml-cpp는 0-based
                            e.mark.column + 1,
                            e.msg),
                std::string{source});
}

}  // namespace

// ---------------------------------------------------------------------------
// EnvironmentLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<Environment, LoadError>
EnvironmentLoader::load(const std::filesystem::path& path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        return fail(LoadErrorCode::kFileNotFound,
                    fmt::format("cannot resolve environment path: {}", ec.message()),
                    path.string());
    }

    spdlog::info("environment_loader: loading environment from '{}'", canonical_path.string());

    // 2. 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(LoadErrorCode::kUnreadable,
                    fmt::format("cannot open file: {}", e.what()),
                    canonical_path.string());
    } catch (const YAML::ParserException& e) {
        return syntax_error(e, canonical_path.string());
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kSyntaxError,
                    fmt::format("YAML error: {}", e.what()),
                    canonical_path.string());
    }

    // 3. 스키마 검증 + 변환
    auto env = parse_root(root, canonical_path.string());
    if (env) {
        spdlog::info("environment_loader: environment loaded: vms={}, fw_rules={}",
                     env->vms.size(), env->fw_rules.size());
    }
    return env;
}

// ---------------------------------------------------------------------------
// EnvironmentLoader::parse 구현
// ---------------------------------------------------------------------------
std::expected<Environment, LoadError>
EnvironmentLoader::parse(std::string_view document, std::string_view source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{document});
    } catch (const YAML::ParserException& e) {
        return syntax_error(e, source_name);
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kSyntaxError,
                    fmt::format("YAML error: {}", e.what()),
                    std::string{source_name});
    }

    return parse_root(root, source_name);
}
