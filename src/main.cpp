#include "app/Application.hpp"

int main(int argc, char** argv)
{
    return Application{ argc, argv }.run();
}
