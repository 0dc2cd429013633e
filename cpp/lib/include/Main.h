/** \file   Main.h
 *  \brief  Default main entry point.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


/** \brief  The program's actual entry point, called by the default main() after the common command-line handling.
 *  \note   main() handles a leading --min-log-level=LEVEL argument, ignores SIGPIPE so that a dead child process shows
 *          up as a failed write, and reports uncaught exceptions w/ LOG_ERROR.
 */
int Main(int argc, char *argv[]);


int main(int argc, char *argv[]) __attribute__((weak));
