#include "typesystem_writer.hpp"

#include "../common/debug/emit.hpp"

#include <fmt/format.h>

namespace hatchet::emit {

std::optional<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "xml")
        return OutputFormat::Xml;
    if (name == "text")
        return OutputFormat::Text;
    return std::nullopt;
}

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

void TypesystemWriter::write(std::ostream& out, const std::vector<RejectionRecord>& records) const {
    debug::emit::log(debug::emit::Id::WriteOutput,
                     fmt::format("{} records", records.size()));
    if (format_ == OutputFormat::Xml)
        write_xml(out, records);
    else
        write_text(out, records);
}

void TypesystemWriter::write_xml(std::ostream& out,
                                 const std::vector<RejectionRecord>& records) const {
    out << "<?xml version=\"1.0\"?>\n";
    if (package_.empty())
        out << "<typesystem>\n";
    else
        out << "<typesystem package=\"" << xml_escape(package_) << "\">\n";

    for (const auto& record : records) {
        std::string cls = xml_escape(record.type);
        if (record.is_type()) {
            out << "  <rejection class=\"" << cls << "\"/>\n";
            continue;
        }
        std::string name = xml_escape(record.member);
        // 種類が分からないメンバーは両方の記法で除外する
        if (record.member_kind != catalog::MemberKind::Field)
            out << "  <rejection class=\"" << cls << "\" function-name=\"" << name << "\"/>\n";
        if (record.member_kind != catalog::MemberKind::Function)
            out << "  <rejection class=\"" << cls << "\" field-name=\"" << name << "\"/>\n";
    }
    out << "</typesystem>\n";
}

void TypesystemWriter::write_text(std::ostream& out,
                                  const std::vector<RejectionRecord>& records) const {
    for (const auto& record : records) {
        if (record.is_type())
            out << "reject " << record.type << "\n";
        else
            out << "reject " << record.type << "." << record.member << " ("
                << catalog::member_kind_str(record.member_kind) << ")\n";
    }
}

}  // namespace hatchet::emit
