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

#include <memory>

#include "core/Exception.hpp"

namespace podkeep::core
{
    // Registers a process wide implementation of an interface for the lifetime of this object.
    // Use a distinct Tag to register several implementations of the same interface
    template<typename Interface, typename Tag = Interface>
    class Service
    {
    public:
        explicit Service(std::unique_ptr<Interface> instance)
        {
            if (_instance)
                throw PodkeepException{ "Service already registered" };
            if (!instance)
                throw PodkeepException{ "Cannot register a null service" };

            _instance = std::move(instance);
        }

        ~Service()
        {
            _instance.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Interface* operator->() const { return _instance.get(); }
        Interface& operator*() const { return *_instance; }

        // nullptr if nothing is registered
        static Interface* get() { return _instance.get(); }
        static bool exists() { return _instance != nullptr; }

    private:
        static inline std::unique_ptr<Interface> _instance;
    };
} // namespace podkeep::core
