#pragma once

int cmd_metadata(int argc, char** argv);
