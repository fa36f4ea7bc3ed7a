#pragma once

#include <QtCore>
#include <QtNetwork>
#include <QDebug>

#include <cmath>
#include <cstring>
#include <functional>
