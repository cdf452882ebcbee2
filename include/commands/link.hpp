#pragma once

int cmd_link(int argc, char** argv);
