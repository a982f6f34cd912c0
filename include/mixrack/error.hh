// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mixrack {

/**
 * @brief Base exception class for all mixrack errors
 *
 * All mixrack-specific exceptions derive from this class, making it easy
 * to catch all mixrack errors with a single catch block.
 *
 * Nothing in this hierarchy is ever thrown from the render path
 * (effect_chain::process, voice_manager::get_stereo, rack::render).
 * Structural failures surface synchronously to the calling control code.
 */
class mixrack_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A processor factory does not know the requested name
 *
 * Thrown by the effect and synth registries and by
 * effect_chain::add_effect. Fully recoverable: the chain or voice pool
 * is left exactly as it was.
 */
class processor_not_found_error : public mixrack_error {
public:
    explicit processor_not_found_error(std::string name)
        : mixrack_error("processor not found: '" + name + "'"),
          m_name(std::move(name)) {
    }

    processor_not_found_error(std::string name, const std::string& reason)
        : mixrack_error("processor not found: '" + name + "' (" + reason + ")"),
          m_name(std::move(name)) {
    }

    [[nodiscard]] const std::string& name() const noexcept {
        return m_name;
    }

private:
    std::string m_name;
};

/**
 * @brief Persistence errors
 *
 * Thrown when chain state cannot be encoded or decoded, such as:
 * - Malformed JSON
 * - Missing required fields
 * - Unsupported state version
 * - Malformed effect id
 */
class serialization_error : public mixrack_error {
public:
    using mixrack_error::mixrack_error;
};

/**
 * @brief Audio device related errors
 *
 * Thrown by output backends when the playback device cannot be
 * initialized, opened or driven.
 */
class device_error : public mixrack_error {
public:
    using mixrack_error::mixrack_error;
};

} // namespace mixrack

/*
 * Copyright (C) 2025
 *
 * This file is part of mixrack.
 *
 * mixrack is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * mixrack is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with mixrack.  If not, see <http://www.gnu.org/licenses/>.
 */
