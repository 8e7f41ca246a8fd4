// This file is made available under Elastic License 2.0.
// This file is based on code available under the Apache license here:
//   https://github.com/apache/incubator-doris/blob/master/be/src/common/config.h

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include "configbase.h"

namespace vshred::config {

// Directory of the log files.
CONF_String(sys_log_dir, "${VSHRED_HOME}/log");
// INFO, WARNING, ERROR, FATAL
CONF_String(sys_log_level, "INFO");
// A log file is rolled once it exceeds this size, in MB.
CONF_Int32(sys_log_max_size_mb, "1024");
// Verbose log modules, e.g. "variant_schema,variant_metadata".
CONF_Strings(sys_log_verbose_modules, "");
// Verbose log level of sys_log_verbose_modules.
CONF_Int32(sys_log_verbose_level, "10");

// Maximum nesting depth of a variant shredding schema. A scalar or unshredded node has depth 1,
// every array or object level adds one. 0 or less means unlimited.
CONF_mInt32(variant_shredding_max_schema_depth, "0");
// Maximum number of shredded object fields in a whole variant shredding schema tree.
// 0 or less means unlimited.
CONF_mInt32(variant_shredding_max_schema_width, "0");

} // namespace vshred::config
