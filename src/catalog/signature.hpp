#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hatchet::catalog {

/// シグネチャ文字列から型名らしい語を取り出す
/// 大文字で始まる識別子のみ。"QFoo::Bar" は "QFoo" として扱う
std::vector<std::string> signature_type_names(std::string_view text);

}  // namespace hatchet::catalog
