#pragma once

int cmd_audit(int argc, char** argv);
