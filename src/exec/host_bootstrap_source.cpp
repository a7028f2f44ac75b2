/***
 * Name: pyp::exec::HostBootstrapSource
 * Purpose: Python program that hosts one generated unit.
 * Inputs (argv after `-c`): unit_path report_path output_path|- seed|- input_name args...
 * Outputs: Exit 0 on success; exit 3 after writing a failure report
 * Theory of Operation:
 *   - sys.argv becomes [input_name] + args; random is seeded when a seed is given;
 *     the unit's directory is prepended to sys.path.
 *   - compile() failures are reported as kind=syntax at SyntaxError.lineno.
 *   - The unit runs in a fresh globals dict holding _PRINT, __name__ and __file__.
 *   - Runtime exceptions report the innermost unit frame as `line` and every unit
 *     frame as `frame`; frames of this bootstrap ("<string>") are dropped.
 *   - SystemExit with code None/0 is success.
 *   Report values escape backslash, newline and tab.
 */
#include "pyp/exec/runner.h"

namespace pyp::exec {

auto HostBootstrapSource() -> const char* {
  return R"PY(import os
import random
import sys
import traceback


def _pyp_escape(value):
    return str(value).replace('\\', '\\\\').replace('\n', '\\n').replace('\t', '\\t')


def _pyp_report(path, fields):
    with open(path, 'w') as handle:
        for key, value in fields:
            handle.write(key + '\t' + _pyp_escape(value) + '\n')
    return 3


def _pyp_runtime_failure(report, unit, exc):
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename != '<string>']
    unit_frames = [f for f in frames if os.path.abspath(f.filename) == unit]
    fields = [('kind', 'runtime'), ('type', type(exc).__name__), ('message', exc)]
    if unit_frames:
        fields.append(('line', unit_frames[-1].lineno))
    fields.extend(('frame', f.lineno) for f in unit_frames)
    if frames:
        fields.append(('detail', ''.join(traceback.format_list(frames[-1:]))))
    fields.append(('traceback', ''.join(traceback.format_list(frames))))
    return _pyp_report(report, fields)


def _pyp_main(argv):
    unit, report, output, seed, name = argv[1:6]
    unit = os.path.abspath(unit)
    sys.argv = [name] + argv[6:]
    if seed != '-':
        random.seed(int(seed))
    sys.path.insert(0, os.path.dirname(unit))
    with open(unit) as handle:
        source = handle.read()
    try:
        code = compile(source, unit, 'exec')
    except SyntaxError as exc:
        detail = ''.join(traceback.format_exception_only(type(exc), exc))
        return _pyp_report(report, [('kind', 'syntax'), ('type', type(exc).__name__), ('message', exc),
                                    ('line', exc.lineno or ''), ('detail', detail)])
    sink = sys.stdout if output == '-' else open(output, 'w')

    def _PRINT(line):
        sink.write(line + '\n')

    scope = {'__name__': '__main__', '__file__': unit, '__builtins__': __builtins__, '_PRINT': _PRINT}
    try:
        try:
            exec(code, scope)
        finally:
            if sink is sys.stdout:
                sink.flush()
            else:
                sink.close()
    except SystemExit as exc:
        if exc.code is None or exc.code == 0:
            return 0
        return _pyp_runtime_failure(report, unit, exc)
    except BaseException as exc:
        return _pyp_runtime_failure(report, unit, exc)
    return 0


sys.exit(_pyp_main(list(sys.argv)))
)PY";
}

}  // namespace pyp::exec
