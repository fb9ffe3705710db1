#include "io/fasta_writer.hpp"

#include <cstdio>

namespace epitizer {

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "fasta") {
        out = OutputFormat::kFasta;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else {
        error_msg = "unknown output format '" + str + "'";
        return false;
    }
    return true;
}

void write_fasta(std::ostream& out, const std::vector<FastaRecord>& records) {
    for (const auto& r : records) {
        out << '>' << r.id << '\n' << r.sequence << '\n';
    }
}

static void json_escape(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out << buf;
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

void write_conversion_json(std::ostream& out, const std::string& input_name,
                           const ConversionResult& result) {
    out << "{\n";
    out << "  \"input\": "; json_escape(out, input_name); out << ",\n";

    out << "  \"records\": [";
    for (size_t i = 0; i < result.records.size(); i++) {
        const auto& r = result.records[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"header\": "; json_escape(out, r.id);
        out << ", \"sequence\": "; json_escape(out, r.sequence);
        out << "}";
    }
    out << (result.records.empty() ? "],\n" : "\n  ],\n");

    out << "  \"warnings\": [";
    for (size_t i = 0; i < result.warnings.size(); i++) {
        const auto& w = result.warnings[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"kind\": \"" << warning_kind_name(w.kind) << "\"";
        out << ", \"position\": " << w.position;
        out << ", \"message\": "; json_escape(out, w.message);
        out << "}";
    }
    out << (result.warnings.empty() ? "],\n" : "\n  ],\n");

    out << "  \"candidates\": " << result.candidates << ",\n";
    out << "  \"empty_skipped\": " << result.empty_skipped << ",\n";
    out << "  \"duplicates_removed\": " << result.duplicates_removed << "\n";
    out << "}\n";
}

void write_conversion(std::ostream& out, const std::string& input_name,
                      const ConversionResult& result, OutputFormat fmt) {
    if (fmt == OutputFormat::kJson) {
        write_conversion_json(out, input_name, result);
    } else {
        write_fasta(out, result.records);
    }
}

} // namespace epitizer
