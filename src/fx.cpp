#include "fx.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "util.hpp"

static constexpr size_t FX_LIST_WIDTH = 50;

std::string fx_chain_label(const std::vector<std::string>& names) {
    return join_args(names, " \xe2\x86\x92 ");
}

bool apply_fx_chain(const Config& cfg,
    const std::vector<std::string>& names,
    const Bytes& input,
    Bytes& out,
    std::string& err)
{
    if (names.empty()) {
        err = "no transforms given";
        return false;
    }

    std::vector<FxDescriptor> chain;
    for (const auto& n : names) {
        FxDescriptor fx;
        if (!get_fx(cfg, n, fx, err)) return false;
        chain.push_back(std::move(fx));
    }

    Bytes current = input;
    for (size_t i = 0; i < chain.size(); ++i) {
        const FxDescriptor& fx = chain[i];
        std::string step = "transform \"" + fx.name + "\" (step " + std::to_string(i + 1) + ")";

        Bytes next;
        if (!run_filter(fx_command(fx), current, next)) {
            audit_log_level(LogLevel::WARN,
                "Transform " + fx.name + " failed",
                "fx",
                "failure");
            err = step + " failed; clipboard unchanged";
            return false;
        }
        if (next.empty()) {
            err = step + " produced empty output; clipboard unchanged";
            return false;
        }
        current = std::move(next);
    }

    out = std::move(current);
    return true;
}

static std::string fx_summary(const FxDescriptor& fx) {
    std::string text = fx.description;
    if (text.empty()) {
        text = fx.shell.empty() ? join_args(fx.cmd) : "sh -c \"" + fx.shell + "\"";
    }
    if (text.size() > FX_LIST_WIDTH) {
        text = text.substr(0, FX_LIST_WIDTH - 3) + "...";
    }
    return text;
}

void print_fx_list(std::ostream& os, const Config& cfg) {
    if (cfg.fx.empty()) {
        os << "No transforms defined.\n"
            << "Add them under fx: in " << (cfg.path.empty() ? config_file_path() : cfg.path) << ", e.g.\n"
            << "\n"
            << "  fx:\n"
            << "    upper:\n"
            << "      cmd: [tr, a-z, A-Z]\n"
            << "      description: Uppercase\n";
        return;
    }

    size_t width = 4;
    for (const auto& kv : cfg.fx) width = std::max(width, kv.first.size());

    os << std::left << std::setw(static_cast<int>(width)) << "NAME" << "  DESCRIPTION\n";
    for (const auto& kv : cfg.fx) {
        os << std::left << std::setw(static_cast<int>(width)) << kv.first << "  "
            << fx_summary(kv.second) << "\n";
    }
}
