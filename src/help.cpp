#include "argtree/help.hpp"

#include <sstream>

#include "argtree/command.hpp"
#include "argtree/utils.hpp"

namespace argtree {

namespace {

std::string namesFor(const std::string& longName, char shortName) {
    std::string names;
    if (shortName != '\0') names += std::string("-") + shortName;
    if (!longName.empty()) {
        if (!names.empty()) names += ", ";
        names += "--" + longName;
    }
    return names;
}

std::string usageToken(const Argument& a) {
    std::string token = a.required() ? "<" + a.name() + ">" : "[" + a.name() + "]";
    if (a.arity().max() > 1) token += "...";
    return token;
}

std::string quoteIfString(const std::string& type, const std::string& v) {
    if (type == "string") return "\"" + v + "\"";
    return v;
}

std::string defaultText(const Parameter& p) {
    if (!p.hasDefaults() || p.defaults().empty()) return {};
    std::vector<std::string> parts;
    for (const auto& d : p.defaults()) parts.push_back(quoteIfString(p.typeName(), d));
    return "(default: " + utils::join(parts, ", ") + ")";
}

void appendDescription(std::string& line, const std::string& desc, const std::string& suffix) {
    if (desc.empty() && suffix.empty()) return;
    line += " - " + desc;
    if (!suffix.empty()) {
        if (!desc.empty()) line.push_back(' ');
        line += suffix;
    }
}

std::string formatArgumentForHelp(const Argument& a) {
    std::string line = a.name();
    if (!a.typeName().empty()) line += " " + a.typeName();
    std::string suffix = a.required() ? "(required)" : defaultText(a);
    appendDescription(line, a.description(), suffix);
    return line;
}

void appendParameters(std::ostringstream& oss, const Command& cmd) {
    for (const auto& o : cmd.options()) {
        if (!o.hidden()) oss << "  " << formatOptionForHelp(o) << "\n";
    }
    for (const auto& f : cmd.flags()) {
        if (!f.hidden()) oss << "  " << formatFlagForHelp(f) << "\n";
    }
}

bool hasVisibleParameters(const Command& cmd) {
    for (const auto& o : cmd.options()) {
        if (!o.hidden()) return true;
    }
    for (const auto& f : cmd.flags()) {
        if (!f.hidden()) return true;
    }
    return false;
}

} // namespace

std::string formatOptionForHelp(const Option& option) {
    std::string line = namesFor(option.longName(), option.shortName());
    if (!option.typeName().empty() && option.arity().max() > 0) {
        line += " " + option.typeName();
        if (option.arity().max() > 1) line += "...";
    }
    appendDescription(line, option.description(), defaultText(option));
    return line;
}

std::string formatFlagForHelp(const Flag& flag) {
    std::string line = namesFor(flag.longName(), flag.shortName());
    appendDescription(line, flag.description(), flag.defaultValue() ? "(default: true)" : "");
    return line;
}

std::string renderUsage(const Command& cmd) {
    std::ostringstream oss;
    oss << "Usage: " << cmd.commandPath();
    if (!cmd.subcommands().empty()) oss << " [command]";
    oss << " [options]";
    for (const auto& a : cmd.arguments()) oss << " " << usageToken(a);
    oss << "\n";
    return oss.str();
}

std::string renderHelp(const Command& cmd) {
    std::ostringstream oss;
    oss << renderUsage(cmd);
    if (!cmd.description().empty()) oss << "\n" << cmd.description() << "\n";

    if (!cmd.arguments().empty()) {
        oss << "\nArguments:\n";
        for (const auto& a : cmd.arguments()) oss << "  " << formatArgumentForHelp(a) << "\n";
    }

    if (!cmd.subcommands().empty()) {
        oss << "\nCommands:\n";
        for (const auto& c : cmd.subcommands()) {
            oss << "  " << c->name();
            if (!c->description().empty()) oss << " - " << c->description();
            oss << "\n";
        }
    }

    oss << "\nOptions:\n";
    appendParameters(oss, cmd);
    oss << "  -h, --help - Show help\n";

    bool globalHeader = false;
    for (const auto* p = cmd.parent(); p; p = p->parent()) {
        if (!hasVisibleParameters(*p)) continue;
        if (!globalHeader) {
            oss << "\nGlobal Options:\n";
            globalHeader = true;
        }
        appendParameters(oss, *p);
    }
    return oss.str();
}

} // namespace argtree
