/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gflags/gflags.h>

// Used in tempo/common/base/Exceptions.h

DEFINE_bool(
    tempo_log_check_failures,
    true,
    "Log every failing TEMPO_CHECK / TEMPO_USER_CHECK with glog before the "
    "exception is thrown");

// Used in tempo/tz/ZoneRegistry.cpp

DEFINE_string(
    tempo_zone_file_path,
    "",
    "Zone record file loaded into the process-wide zone registry when the "
    "registry config does not name one. Empty means built-in zones only.");
