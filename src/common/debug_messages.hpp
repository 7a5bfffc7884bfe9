#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/catalog.hpp"
#include "debug/closure.hpp"
#include "debug/emit.hpp"
#include "debug/harvest.hpp"
#include "debug/policy.hpp"

// 使用例:
// debug::harvest::log(debug::harvest::Id::Start);
// debug::closure::log(debug::closure::Id::UsefulType, "QWidget");
// debug::catalog::log(debug::catalog::Id::NameDropped, "T", debug::Level::Trace);
