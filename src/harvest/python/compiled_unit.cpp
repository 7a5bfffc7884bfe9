// ============================================================
// marshal 形式の読み込み
// ============================================================

#include "compiled_unit.hpp"

#include "../../common/debug/harvest.hpp"

#include <fmt/format.h>

namespace hatchet::harvest::python {

namespace {

constexpr uint8_t FLAG_REF = 0x80;
constexpr int MAX_DEPTH = 2000;

/// marshal オブジェクト（識別子の収集に必要な情報だけを持つ）
struct Object;
using ObjectPtr = std::shared_ptr<Object>;

enum class ObjectKind { Null, Scalar, String, Sequence, Code };

struct Object {
    ObjectKind kind = ObjectKind::Scalar;
    std::string text;                       // String
    std::vector<ObjectPtr> items;           // Sequence（tuple, list, set, dict）
    std::shared_ptr<CompiledUnit> code;     // Code
};

ObjectPtr make_object(ObjectKind kind) {
    auto obj = std::make_shared<Object>();
    obj->kind = kind;
    return obj;
}

}  // namespace

// ============================================================
// marshal リーダー
// ============================================================
class MarshalReader {
   public:
    MarshalReader(std::string_view data, CodeLayout layout) : data_(data), layout_(layout) {}

    ObjectPtr read_object() {
        if (++depth_ > MAX_DEPTH)
            throw MarshalError("marshal data nested too deeply");
        ObjectPtr obj = read_object_body();
        --depth_;
        return obj;
    }

   private:
    ObjectPtr read_object_body() {
        uint8_t code = read_u8();
        bool flag = (code & FLAG_REF) != 0;
        char type = static_cast<char>(code & ~FLAG_REF);

        // code オブジェクトは内容より先に参照スロットを確保する
        if (type == 'c') {
            size_t slot = refs_.size();
            if (flag)
                refs_.push_back(nullptr);
            ObjectPtr obj = read_code();
            if (flag)
                refs_[slot] = obj;
            return obj;
        }

        ObjectPtr obj;
        switch (type) {
            case '0':
                obj = make_object(ObjectKind::Null);
                break;
            case 'N':
            case 'T':
            case 'F':
            case 'S':
            case '.':
                obj = make_object(ObjectKind::Scalar);
                break;
            case 'i':
                skip(4);
                obj = make_object(ObjectKind::Scalar);
                break;
            case 'I':
            case 'g':
                skip(8);
                obj = make_object(ObjectKind::Scalar);
                break;
            case 'y':
                skip(16);
                obj = make_object(ObjectKind::Scalar);
                break;
            case 'l': {
                int32_t n = read_i32();
                int64_t digits = n < 0 ? -static_cast<int64_t>(n) : n;
                skip(static_cast<size_t>(digits) * 2);
                obj = make_object(ObjectKind::Scalar);
                break;
            }
            case 'f':
                skip(read_u8());
                obj = make_object(ObjectKind::Scalar);
                break;
            case 'x':
                skip(read_u8());
                skip(read_u8());
                obj = make_object(ObjectKind::Scalar);
                break;
            case 's':
            case 'u':
            case 'a':
            case 'A':
            case 't': {
                obj = make_object(ObjectKind::String);
                obj->text = read_bytes(read_size());
                if (type == 't' && layout_ == CodeLayout::Py2)
                    interned_.push_back(obj);
                break;
            }
            case 'z':
            case 'Z':
                obj = make_object(ObjectKind::String);
                obj->text = read_bytes(read_u8());
                break;
            case 'R': {
                // 2.x の intern 済み文字列参照
                size_t index = read_size();
                if (index >= interned_.size())
                    throw MarshalError(fmt::format("bad interned string reference {}", index));
                return interned_[index];
            }
            case 'r': {
                size_t index = read_size();
                if (index >= refs_.size() || !refs_[index])
                    throw MarshalError(fmt::format("bad object reference {}", index));
                return refs_[index];
            }
            case ')':
                return read_sequence(read_u8(), flag);
            case '(':
            case '[':
            case '<':
            case '>':
                return read_sequence(read_size(), flag);
            case '{':
                return read_dict(flag);
            default:
                throw MarshalError(fmt::format("unknown marshal type code 0x{:02x} at offset {}",
                                               code, pos_ - 1));
        }

        if (flag)
            refs_.push_back(obj);
        return obj;
    }

    ObjectPtr read_sequence(size_t count, bool flag) {
        auto obj = make_object(ObjectKind::Sequence);
        if (flag)
            refs_.push_back(obj);
        for (size_t i = 0; i < count; ++i) {
            obj->items.push_back(read_object());
        }
        return obj;
    }

    ObjectPtr read_dict(bool flag) {
        auto obj = make_object(ObjectKind::Sequence);
        if (flag)
            refs_.push_back(obj);
        while (true) {
            ObjectPtr key = read_object();
            if (key->kind == ObjectKind::Null)
                break;
            obj->items.push_back(key);
            obj->items.push_back(read_object());
        }
        return obj;
    }

    ObjectPtr read_code() {
        // 先頭の整数フィールド数
        int leading_ints = 5;
        switch (layout_) {
            case CodeLayout::Py2:
                leading_ints = 4;
                break;
            case CodeLayout::Py30:
                leading_ints = 5;
                break;
            case CodeLayout::Py38:
                leading_ints = 6;
                break;
            case CodeLayout::Py311:
                leading_ints = 5;
                break;
        }
        skip(static_cast<size_t>(leading_ints) * 4);

        auto unit = std::make_shared<CompiledUnit>();
        read_object();  // co_code
        ObjectPtr consts = read_object();
        ObjectPtr names = read_object();

        if (layout_ == CodeLayout::Py311) {
            read_object();  // co_localsplusnames
            read_object();  // co_localspluskinds
            read_object();  // co_filename
            ObjectPtr name = read_object();
            read_object();  // co_qualname
            skip(4);        // co_firstlineno
            read_object();  // co_linetable
            read_object();  // co_exceptiontable
            unit->name_ = as_string(name);
        } else {
            read_object();  // co_varnames
            read_object();  // co_freevars
            read_object();  // co_cellvars
            read_object();  // co_filename
            ObjectPtr name = read_object();
            skip(4);        // co_firstlineno
            read_object();  // co_lnotab
            unit->name_ = as_string(name);
        }

        for (const auto& item : names->items) {
            if (item && item->kind == ObjectKind::String)
                unit->names_.push_back(item->text);
        }
        collect_constants(consts, *unit);

        auto obj = make_object(ObjectKind::Code);
        obj->code = unit;
        return obj;
    }

    // 定数の文字列と code を集める（タプル、frozenset の中も見る）
    void collect_constants(const ObjectPtr& root, CompiledUnit& unit) {
        std::vector<const Object*> stack;
        if (root)
            stack.push_back(root.get());
        while (!stack.empty()) {
            const Object* obj = stack.back();
            stack.pop_back();
            switch (obj->kind) {
                case ObjectKind::String:
                    unit.constants_.push_back(obj->text);
                    break;
                case ObjectKind::Code:
                    unit.children_.push_back(obj->code);
                    break;
                case ObjectKind::Sequence:
                    for (auto it = obj->items.rbegin(); it != obj->items.rend(); ++it) {
                        if (*it)
                            stack.push_back(it->get());
                    }
                    break;
                default:
                    break;
            }
        }
    }

    static std::string as_string(const ObjectPtr& obj) {
        return obj && obj->kind == ObjectKind::String ? obj->text : std::string("<code>");
    }

    void require(size_t n) {
        if (pos_ + n > data_.size())
            throw MarshalError(
                fmt::format("unexpected end of marshal data at offset {} (need {} bytes)", pos_, n));
    }

    uint8_t read_u8() {
        require(1);
        return static_cast<uint8_t>(data_[pos_++]);
    }

    int32_t read_i32() {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
        }
        pos_ += 4;
        return static_cast<int32_t>(v);
    }

    size_t read_size() {
        int32_t n = read_i32();
        if (n < 0)
            throw MarshalError(fmt::format("negative size {} in marshal data", n));
        return static_cast<size_t>(n);
    }

    std::string read_bytes(size_t n) {
        require(n);
        std::string s(data_.substr(pos_, n));
        pos_ += n;
        return s;
    }

    void skip(size_t n) {
        require(n);
        pos_ += n;
    }

    std::string_view data_;
    CodeLayout layout_;
    size_t pos_ = 0;
    int depth_ = 0;
    std::vector<ObjectPtr> refs_;
    std::vector<ObjectPtr> interned_;
};

PycHeader read_pyc_header(std::string_view data) {
    if (data.size() < 8 || data[2] != '\r' || data[3] != '\n')
        throw MarshalError("not a compiled python file (bad magic)");

    PycHeader header;
    header.magic = static_cast<uint16_t>(static_cast<uint8_t>(data[0]) |
                                         (static_cast<uint8_t>(data[1]) << 8));
    uint16_t m = header.magic;

    if (m < 3000 || m >= 4000) {
        // 2.x: magic + mtime
        header.header_size = 8;
        header.layout = CodeLayout::Py2;
    } else if (m < 3210) {
        // 3.0 - 3.2: magic + mtime
        header.header_size = 8;
        header.layout = CodeLayout::Py30;
    } else if (m < 3390) {
        // 3.3 - 3.6: magic + mtime + size
        header.header_size = 12;
        header.layout = CodeLayout::Py30;
    } else {
        // 3.7+: magic + flags + (mtime + size | hash)
        header.header_size = 16;
        if (m < 3410)
            header.layout = CodeLayout::Py30;
        else if (m < 3450)
            header.layout = CodeLayout::Py38;
        else
            header.layout = CodeLayout::Py311;
    }

    if (data.size() < header.header_size)
        throw MarshalError("truncated compiled python header");
    return header;
}

std::shared_ptr<CompiledUnit> CompiledUnit::from_pyc(std::string_view data) {
    PycHeader header = read_pyc_header(data);
    debug::harvest::log(debug::harvest::Id::CompiledUnit,
                        fmt::format("magic {} header {} bytes", header.magic, header.header_size),
                        debug::Level::Trace);
    return from_marshal(data.substr(header.header_size), header.layout);
}

std::shared_ptr<CompiledUnit> CompiledUnit::from_marshal(std::string_view data, CodeLayout layout) {
    MarshalReader reader(data, layout);
    ObjectPtr obj = reader.read_object();
    if (obj->kind != ObjectKind::Code)
        throw MarshalError("marshal data does not start with a code object");
    return obj->code;
}

std::vector<const CodeUnit*> CompiledUnit::nested_units() const {
    std::vector<const CodeUnit*> units;
    units.reserve(children_.size());
    for (const auto& child : children_) {
        units.push_back(child.get());
    }
    return units;
}

}  // namespace hatchet::harvest::python
