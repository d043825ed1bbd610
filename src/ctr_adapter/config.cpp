// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/config.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/log.h"

#include <cstdlib>
#include <fstream>

#include <unistd.h>

namespace ctr_adapter {

auto default_root() -> std::filesystem::path
{
    const auto *xdg_runtime_dir = getenv("XDG_RUNTIME_DIR");
    if (xdg_runtime_dir != nullptr && *xdg_runtime_dir != '\0') {
        return std::filesystem::path{ xdg_runtime_dir } / "ctr-adapter";
    }

    return std::filesystem::path{ "/run/user" } / std::to_string(geteuid()) / "ctr-adapter";
}

void from_json(const nlohmann::json &j, runtime_config &config)
{
    if (!j.is_object()) {
        throw error(error_kind::parse_error, "configuration must be a JSON object");
    }

    if (auto it = j.find("root"); it != j.end()) {
        config.root = it->get<std::string>();
    }
    if (auto it = j.find("tmpDir"); it != j.end()) {
        config.tmp_dir = it->get<std::string>();
    }
    if (auto it = j.find("ociRuntime"); it != j.end()) {
        config.oci_runtime = it->get<std::string>();
    }
    if (auto it = j.find("stopTimeout"); it != j.end()) {
        config.stop_timeout = it->get<unsigned int>();
    }
    if (auto it = j.find("waitInterval"); it != j.end()) {
        config.wait_interval = std::chrono::milliseconds{ it->get<unsigned int>() };
    }
}

auto load_config(const std::optional<std::filesystem::path> &file,
                 const config_overrides &overrides) -> runtime_config
{
    runtime_config config;
    config.root = default_root();

    if (file) {
        std::ifstream istrm(*file);
        if (istrm.fail()) {
            throw error(error_kind::io_error, "failed to open configuration " + file->string());
        }

        try {
            from_json(nlohmann::json::parse(istrm), config);
        } catch (const nlohmann::json::exception &e) {
            throw error(error_kind::parse_error,
                        "invalid configuration " + file->string() + ": " + e.what());
        }
    }

    if (overrides.root) {
        config.root = *overrides.root;
    }
    if (overrides.tmp_dir) {
        config.tmp_dir = *overrides.tmp_dir;
    }
    if (overrides.oci_runtime) {
        config.oci_runtime = *overrides.oci_runtime;
    }

    if (config.tmp_dir.empty()) {
        config.tmp_dir = config.root / "tmp";
    }

    CTR_ADAPTER_DEBUG() << "using root " << config.root << ", tmpdir " << config.tmp_dir
                        << ", oci runtime " << config.oci_runtime;
    return config;
}

} // namespace ctr_adapter
