#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "infra/gdal.h"
#include "infra/log.h"

#include <clocale>

int main(int argc, char** argv)
{
    std::setlocale(LC_ALL, "C");

    inf::gdal::Registration reg;
    inf::LogRegistration logReg("primatest");

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
