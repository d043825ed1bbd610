// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/interface.h"

namespace ctr_adapter {

// ensure vtable only here
interface::~interface() = default;

} // namespace ctr_adapter
