#pragma once

#include "types.h"
#include "error.h"
#include "app.h"
#include "loop.h"
#include "dispatch.h"
#include "window.h"
#include "callbacks.h"
#include "webview.h"
#include "protocol.h"
#include "shortcut.h"
#include "desktop.h"
#include "notification.h"
