// This is copyrighted software. More information is at the end of this file.
#include <mixrack/sdk/processor.hh>

namespace mixrack {
    signal_processor::signal_processor() = default;
    signal_processor::~signal_processor() = default;

    void signal_processor::reset() {
    }

    void signal_processor::set_sample_rate(sample_rate_t) {
    }

    sidechain_processor::sidechain_processor() = default;
    sidechain_processor::~sidechain_processor() = default;

    signal_generator::signal_generator() = default;
    signal_generator::~signal_generator() = default;

    void signal_generator::reset() {
    }

    void signal_generator::set_sample_rate(sample_rate_t) {
    }
}

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
