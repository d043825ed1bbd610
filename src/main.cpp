// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/app.h"

auto main(int argc, char **argv) -> int
{
    return ctr_adapter::main(argc, argv);
}
