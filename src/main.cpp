#include "app/Application.hpp"

int main(int argc, char** argv)
{
    return philoglot::app::Application{ argc, argv }.run();
}
