/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Podkeep.
 *
 * Podkeep is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Podkeep is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Podkeep.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <libconfig.h++>

#include "core/IConfig.hpp"

namespace podkeep::core
{
    // libconfig backed configuration file
    class Config final : public IConfig
    {
    public:
        Config(const std::filesystem::path& p);
        ~Config() override = default;

        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;
        Config(Config&&) = delete;
        Config& operator=(Config&&) = delete;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override;
        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override;
        unsigned long getULong(std::string_view setting, unsigned long def) override;
        bool getBool(std::string_view setting, bool def) override;

        template<typename T, typename Def>
        T lookupOr(std::string_view setting, Def def);

        libconfig::Config _config;
    };
} // namespace podkeep::core
