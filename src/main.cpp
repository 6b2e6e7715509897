// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "prefetch_app.h"

int main(int argc, char** argv) {
    thumbkit::PrefetchApp app;
    return app.run(argc, argv);
}
