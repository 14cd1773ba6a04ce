#ifndef BLINKREADER_TABID_H
#define BLINKREADER_TABID_H

#include <QtGlobal>

// Stable tab identifier. Positions shift when tabs close, ids never do.
using TabId = quint64;

constexpr TabId InvalidTabId = 0;

#endif // BLINKREADER_TABID_H
