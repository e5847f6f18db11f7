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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace podkeep::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw PodkeepException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw PodkeepException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw PodkeepException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    template<typename T, typename Def>
    T Config::lookupOr(std::string_view setting, Def def)
    {
        try
        {
            const libconfig::Setting& value{ _config.lookup(std::string{ setting }) };
            if constexpr (std::is_same_v<T, const char*>)
                return static_cast<const char*>(value);
            else if constexpr (std::is_same_v<T, bool>)
                return static_cast<bool>(value);
            else
                return static_cast<T>(static_cast<long long>(value));
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            return def;
        }
        catch (const libconfig::SettingTypeException&)
        {
            PODKEEP_LOG(CONFIG, WARNING, "Setting '" << setting << "' has an unexpected type, using default value");
            return def;
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const char* value{ lookupOr<const char*>(setting, static_cast<const char*>(nullptr)) };
        return value ? std::string_view{ value } : def;
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const char* value{ lookupOr<const char*>(setting, static_cast<const char*>(nullptr)) };
        return value ? std::filesystem::path{ std::string{ value } } : def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const long long value{ lookupOr<long long>(setting, static_cast<long long>(def)) };
        if (value < 0)
        {
            PODKEEP_LOG(CONFIG, WARNING, "Setting '" << setting << "' must be positive, using default value");
            return def;
        }

        return static_cast<unsigned long>(value);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookupOr<bool>(setting, def);
    }
} // namespace podkeep::core
